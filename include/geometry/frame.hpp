#pragma once
#include "core/types.hpp"
#include "geometry/edge.hpp"
#include "geometry/segment_table.hpp"
#include <array>
#include <cstddef>
#include <random>
#include <utility>
#include <vector>

namespace bmc_2d {

/**
 * @brief Closed polygonal device boundary
 *
 * Edge i runs from vertex i to vertex i+1 and the last edge closes the
 * polygon. Either winding is accepted; normals always point inward.
 */
class Frame {
public:
    Frame(const std::vector<Vec2>& vertices, const std::vector<int>& layers);

    // Axis-aligned device [0, width] x [0, height]; layers are bottom, right, top, left
    static Frame rectangle(double width, double height, const std::array<int, 4>& layers);

    const std::vector<Edge>& edges() const { return edges_; }
    const Edge& edge(std::size_t i) const { return edges_[i]; }
    void set_edge_in_prob(std::size_t i, std::vector<double> in_prob, std::vector<double> cum_prob);
    std::size_t size() const { return edges_.size(); }

    const std::vector<Vec2>& vertices() const { return vertices_; }
    const SegmentTable& table() const { return table_; }

    int max_layer() const;
    std::vector<std::size_t> edges_in_layer(int layer) const;
    bool has_layer(int layer) const { return !edges_in_layer(layer).empty(); }

    // Points within `tolerance` of the boundary count as inside
    bool contains(const Vec2& p, double tolerance = 1e-10) const;

    /**
     * @brief Draw an injection point on a contact layer
     *
     * The edge is chosen with probability proportional to its length and the
     * point is uniform along it.
     *
     * @return (position, edge index)
     */
    std::pair<Vec2, std::size_t> sample_injection(int layer, std::mt19937& rng) const;

private:
    std::vector<Vec2> vertices_;
    std::vector<Edge> edges_;
    SegmentTable table_;
};

} // namespace bmc_2d
