#include "geometry/segment_table.hpp"

namespace bmc_2d {

SegmentTable::SegmentTable(const std::vector<Edge>& segments) {
    px0.reserve(segments.size());
    py0.reserve(segments.size());
    x23.reserve(segments.size());
    y23.reserve(segments.size());
    for (const auto& s : segments) {
        px0.push_back(s.p0().x);
        py0.push_back(s.p0().y);
        x23.push_back(s.p0().x - s.p1().x);
        y23.push_back(s.p0().y - s.p1().y);
    }
}

bool SegmentTable::solve(std::size_t i, const Vec2& from, const Vec2& to, double& t, double& u) const {
    const double x01 = from.x - to.x;
    const double y01 = from.y - to.y;
    const double x02 = from.x - px0[i];
    const double y02 = from.y - py0[i];

    const double denom = x01 * y23[i] - y01 * x23[i];
    if (denom == 0.0) {
        return false;
    }

    t = (x02 * y23[i] - y02 * x23[i]) / denom;
    u = -(x01 * y02 - y01 * x02) / denom;
    return true;
}

bool line_intersection(const Vec2& a0, const Vec2& a1, const Vec2& b0, const Vec2& b1, Vec2& out) {
    const double denom = (a0.x - a1.x) * (b0.y - b1.y) - (a0.y - a1.y) * (b0.x - b1.x);
    if (denom == 0.0) {
        return false;
    }
    const double a = a0.x * a1.y - a0.y * a1.x;
    const double b = b0.x * b1.y - b0.y * b1.x;
    out.x = (a * (b0.x - b1.x) - (a0.x - a1.x) * b) / denom;
    out.y = (a * (b0.y - b1.y) - (a0.y - a1.y) * b) / denom;
    return true;
}

} // namespace bmc_2d
