#pragma once
#include "core/types.hpp"
#include "geometry/edge.hpp"
#include "geometry/segment_table.hpp"
#include <cstddef>
#include <utility>
#include <vector>

namespace bmc_2d {

/**
 * @brief Counting lines (ohmic lines) laid across the device
 *
 * They never change a trajectory; a Simulation only tallies how often each
 * one is crossed. Layers start at 0 and are shifted past the device layers by
 * offset_layers() so both can share one counter namespace.
 */
class AuxiliaryLines {
public:
    AuxiliaryLines() = default;
    explicit AuxiliaryLines(std::vector<Edge> lines);

    // Each segment gets its own layer 0, 1, 2, ... in input order
    static AuxiliaryLines from_segments(const std::vector<std::pair<Vec2, Vec2>>& segments);

    const std::vector<Edge>& lines() const { return lines_; }
    const Edge& line(std::size_t i) const { return lines_[i]; }
    const SegmentTable& table() const { return table_; }
    std::size_t size() const { return lines_.size(); }
    bool empty() const { return lines_.empty(); }

    void offset_layers(int offset);

private:
    std::vector<Edge> lines_;
    SegmentTable table_;
};

} // namespace bmc_2d
