#pragma once
#include <cstddef>
#include <vector>

namespace bmc_2d {

/**
 * @brief Crossing tally for every device edge and auxiliary line
 *
 * Indices follow Frame::edges() and AuxiliaryLines::lines(). Partial tallies
 * from independent workers are combined with merge().
 */
struct EdgeCounts {
    std::vector<long long> edges;
    std::vector<long long> lines;

    EdgeCounts() = default;
    EdgeCounts(std::size_t n_edges, std::size_t n_lines)
        : edges(n_edges, 0), lines(n_lines, 0) {}

    void merge(const EdgeCounts& other);
    long long total_edges() const;
    long long total_lines() const;

    bool operator==(const EdgeCounts& o) const { return edges == o.edges && lines == o.lines; }
};

} // namespace bmc_2d
