#pragma once
#include "core/types.hpp"
#include "geometry/edge.hpp"
#include <cstddef>
#include <vector>

namespace bmc_2d {

/**
 * @brief Precomputed coefficients for testing one step against many segments
 *
 * Follows the zero-indexed notation of the standard line-line intersection:
 * point 0 / 1 are the step start / end, point 2 / 3 the segment start / end.
 * For segment i the table keeps p2 = (px0, py0) and p2 - p3 = (x23, y23).
 */
struct SegmentTable {
    std::vector<double> px0;
    std::vector<double> py0;
    std::vector<double> x23;
    std::vector<double> y23;

    SegmentTable() = default;
    explicit SegmentTable(const std::vector<Edge>& segments);

    std::size_t size() const { return px0.size(); }

    /**
     * @brief Step parameter t and segment parameter u for segment i
     *
     * @return false when step and segment are parallel or collinear
     */
    bool solve(std::size_t i, const Vec2& from, const Vec2& to, double& t, double& u) const;
};

// Intersection of the infinite lines a0-a1 and b0-b1; false when parallel
bool line_intersection(const Vec2& a0, const Vec2& a1, const Vec2& b0, const Vec2& b1, Vec2& out);

} // namespace bmc_2d
