#include "transport/intersection_engine.hpp"
#include <algorithm>
#include <cmath>

namespace bmc_2d {

namespace {
    inline bool in_unit_range(double v) {
        return 0.0 <= v && v <= 1.0;
    }
}

std::vector<Intersection> find_intersections(
    const std::vector<Edge>& edges,
    const SegmentTable& table,
    const Vec2& from,
    const Vec2& to,
    double bias
) {
    std::vector<Intersection> out;
    const Vec2 step = to - from;
    const double step_len = step.norm();
    if (step_len == 0.0) {
        return out;
    }
    const Vec2 bias_vector = step * (bias / step_len);
    const double t_max = 1.0 + bias / step_len;

    for (std::size_t i = 0; i < table.size(); ++i) {
        double t = 0.0, u = 0.0;
        if (!table.solve(i, from, to, t, u)) {
            continue;  // Parallel or collinear: cannot be crossed
        }
        if (t < 0.0 || t > t_max || !in_unit_range(u)) {
            continue;
        }
        const Edge& edge = edges[i];
        if (step.dot(edge.normal()) >= 0.0) {
            continue;
        }

        const Vec2 crossing = edge.point_at(u);
        if (crossing == from) {
            continue;
        }
        const Vec2 hit = crossing - bias_vector;
        out.push_back({i, hit, (hit - from).norm(), crossing});
    }
    return out;
}

std::vector<Intersection> sorted_intersections(
    const std::vector<Edge>& edges,
    const SegmentTable& table,
    const Vec2& from,
    const Vec2& to,
    double bias
) {
    std::vector<Intersection> out = find_intersections(edges, table, from, to, bias);
    if (out.size() > 1) {
        std::stable_sort(out.begin(), out.end(),
            [](const Intersection& a, const Intersection& b) { return a.distance < b.distance; });
    }
    return out;
}

HitKind classify_hits(const std::vector<Intersection>& sorted, double corner_tolerance) {
    if (sorted.empty()) {
        return HitKind::NONE;
    }
    if (sorted.size() == 1) {
        return HitKind::SINGLE;
    }
    const double d0 = sorted[0].distance;
    const double d1 = sorted[1].distance;
    if (std::abs(d1 - d0) <= corner_tolerance * std::max(1.0, d1)) {
        return HitKind::CORNER;
    }
    return HitKind::SINGLE;
}

std::size_t counted_corner_edge(const std::vector<Edge>& edges, const Intersection& first, const Intersection& second) {
    return edges[second.edge].layer() > edges[first.edge].layer() ? second.edge : first.edge;
}

std::vector<std::size_t> find_crosses(const AuxiliaryLines& lines, const Vec2& from, const Vec2& to) {
    std::vector<std::size_t> crosses;
    const SegmentTable& table = lines.table();
    for (std::size_t i = 0; i < table.size(); ++i) {
        double t = 0.0, u = 0.0;
        if (!table.solve(i, from, to, t, u)) {
            continue;
        }
        if (in_unit_range(t) && in_unit_range(u)) {
            crosses.push_back(i);
        }
    }
    return crosses;
}

} // namespace bmc_2d
