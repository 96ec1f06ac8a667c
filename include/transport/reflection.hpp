#pragma once
#include "band/bandstructure.hpp"
#include "core/types.hpp"
#include "geometry/edge.hpp"
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace bmc_2d {

// No outgoing Fermi state exists for a specular reflection
class ReflectionError : public std::runtime_error {
public:
    explicit ReflectionError(const std::string& what) : std::runtime_error(what) {}
};

struct FermiCrossing {
    FermiState n_f;  // (chord index, 1 - position along the chord)
    Vec2 point;      // Crossing point on the orbit
};

/**
 * @brief Crossings of the Fermi polygon with the line through the current
 *        Fermi point parallel to `edge_direction`
 */
std::vector<FermiCrossing> fermi_intersections(
    const Bandstructure& band,
    const FermiState& n_f,
    const Vec2& edge_direction
);

/**
 * @brief Outgoing Fermi state of a specular reflection off `edge`
 *
 * The momentum component along the edge is conserved, which on the
 * real-space orbit means moving along a line parallel to the edge to the
 * opposite side of the polygon. The crossing whose chord start is nearest to
 * the current Fermi point is taken.
 *
 * @throws ReflectionError if the line meets the polygon nowhere else
 */
FermiState specular(const Bandstructure& band, const FermiState& n_f, const Edge& edge);

// Diffuse re-emission from the edge's injection distribution
FermiState scatter(const Edge& edge, std::mt19937& rng);

/**
 * @brief Joint injection distribution of two edges meeting at a corner
 *
 * Pointwise product of both in_prob vectors, normalized.
 *
 * @return nullopt when the product vanishes everywhere
 */
std::optional<InjectionProbability> corner_in_prob(const Edge& edge_0, const Edge& edge_1);

// Scatter from corner_in_prob(); falls back to `counted` if it vanishes
FermiState corner_scatter(const Edge& edge_0, const Edge& edge_1, const Edge& counted, std::mt19937& rng);

/**
 * @brief Virtual edge bisecting the corner formed by two edges
 *
 * The edge passes through the intersection C of both edge lines. On each line
 * a reference point is taken on the side facing `origin`; the virtual edge is
 * perpendicular to the line from C to the midpoint of the reference points,
 * with its normal pointing toward that midpoint.
 *
 * @return nullopt when the edge lines are parallel
 */
std::optional<Edge> corner_virtual_edge(const Edge& edge_0, const Edge& edge_1, const Vec2& origin, int layer);

// Specular reflection off corner_virtual_edge(), or off `counted` for parallel edges
FermiState corner_specular(
    const Bandstructure& band,
    const FermiState& n_f,
    const Edge& edge_0,
    const Edge& edge_1,
    const Edge& counted,
    const Vec2& origin
);

} // namespace bmc_2d
