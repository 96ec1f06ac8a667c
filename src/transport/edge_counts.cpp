#include "transport/edge_counts.hpp"
#include <stdexcept>

namespace bmc_2d {

void EdgeCounts::merge(const EdgeCounts& other) {
    if (other.edges.size() != edges.size() || other.lines.size() != lines.size()) {
        throw std::invalid_argument("EdgeCounts: cannot merge tallies of different shape");
    }
    for (size_t i = 0; i < edges.size(); ++i) {
        edges[i] += other.edges[i];
    }
    for (size_t i = 0; i < lines.size(); ++i) {
        lines[i] += other.lines[i];
    }
}

long long EdgeCounts::total_edges() const {
    long long total = 0;
    for (long long c : edges) {
        total += c;
    }
    return total;
}

long long EdgeCounts::total_lines() const {
    long long total = 0;
    for (long long c : lines) {
        total += c;
    }
    return total;
}

} // namespace bmc_2d
