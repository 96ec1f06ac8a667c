#pragma once
#include "core/types.hpp"
#include <random>
#include <vector>

namespace bmc_2d {

/**
 * @brief Straight boundary segment of the device
 *
 * The normal is a unit vector pointing from the segment into the device
 * region. A carrier can only hit the segment while moving against it.
 * in_prob / cum_prob hold the injection distribution over Fermi bins and are
 * empty until a Simulation fills them from its band structure.
 */
class Edge {
public:
    // Normal is the left-hand normal of p0 -> p1
    Edge(const Vec2& p0, const Vec2& p1, int layer);

    const Vec2& p0() const { return p0_; }
    const Vec2& p1() const { return p1_; }
    Vec2 direction() const { return p1_ - p0_; }
    double length() const { return direction().norm(); }
    Vec2 point_at(double u) const { return p0_ + u * (p1_ - p0_); }

    const Vec2& normal() const { return normal_; }
    double normal_angle() const { return normal_angle_; }
    void flip_normal();

    int layer() const { return layer_; }
    void set_layer(int layer) { layer_ = layer; }

    void set_in_prob(std::vector<double> in_prob, std::vector<double> cum_prob);
    const std::vector<double>& in_prob() const { return in_prob_; }
    const std::vector<double>& cum_prob() const { return cum_prob_; }
    bool has_in_prob() const { return !cum_prob_.empty(); }

    // Draw an outgoing Fermi bin from this edge's injection distribution
    FermiState sample_injection_index(std::mt19937& rng) const;

    static FermiState compute_injection_index(const std::vector<double>& cum_prob, std::mt19937& rng);

private:
    Vec2 p0_;
    Vec2 p1_;
    Vec2 normal_;
    double normal_angle_ = 0.0;
    int layer_ = 0;
    std::vector<double> in_prob_;
    std::vector<double> cum_prob_;
};

} // namespace bmc_2d
