#include "geometry/aux_lines.hpp"

namespace bmc_2d {

AuxiliaryLines::AuxiliaryLines(std::vector<Edge> lines)
    : lines_(std::move(lines)), table_(lines_)
{
}

AuxiliaryLines AuxiliaryLines::from_segments(const std::vector<std::pair<Vec2, Vec2>>& segments) {
    std::vector<Edge> lines;
    lines.reserve(segments.size());
    for (size_t i = 0; i < segments.size(); ++i) {
        lines.emplace_back(segments[i].first, segments[i].second, static_cast<int>(i));
    }
    return AuxiliaryLines(std::move(lines));
}

void AuxiliaryLines::offset_layers(int offset) {
    for (auto& line : lines_) {
        line.set_layer(line.layer() + offset);
    }
}

} // namespace bmc_2d
