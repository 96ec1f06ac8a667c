#pragma once
#include "core/types.hpp"
#include "geometry/aux_lines.hpp"
#include "geometry/edge.hpp"
#include "geometry/segment_table.hpp"
#include <cstddef>
#include <vector>

namespace bmc_2d {

struct Intersection {
    std::size_t edge;  // Index into the edge list that was tested
    Vec2 point;        // Crossing point, pulled back toward the step start
    double distance;   // |point - step start|
    Vec2 crossing;     // Crossing point on the edge itself
};

enum class HitKind { NONE, SINGLE, CORNER };

/**
 * @brief Edges crossed by the step from -> to, unordered
 *
 * Only edges the step moves into (step . normal < 0) are reported, so the
 * edge a carrier has just left is never hit again. A crossing that coincides
 * with the step start is dropped. Each point is moved back toward `from` by
 * `bias` along the step so the carrier stays inside the device.
 *
 * A wall up to `bias` beyond `to` also counts as crossed, so an orbit that
 * closes on a point of the wall registers the wall instead of stopping a
 * rounding error short of it.
 */
std::vector<Intersection> find_intersections(
    const std::vector<Edge>& edges,
    const SegmentTable& table,
    const Vec2& from,
    const Vec2& to,
    double bias
);

// find_intersections() sorted by ascending distance
std::vector<Intersection> sorted_intersections(
    const std::vector<Edge>& edges,
    const SegmentTable& table,
    const Vec2& from,
    const Vec2& to,
    double bias
);

/**
 * @brief Classify sorted intersections
 *
 * CORNER when the two nearest crossings are within
 * corner_tolerance * max(1, d1) of each other.
 */
HitKind classify_hits(const std::vector<Intersection>& sorted, double corner_tolerance);

// Of the two corner edges, the one with the higher layer; ties keep the nearer
std::size_t counted_corner_edge(const std::vector<Edge>& edges, const Intersection& first, const Intersection& second);

// Auxiliary lines crossed by the step; no direction filter, no bias
std::vector<std::size_t> find_crosses(const AuxiliaryLines& lines, const Vec2& from, const Vec2& to);

} // namespace bmc_2d
