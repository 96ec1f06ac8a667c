#include "geometry/edge.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace bmc_2d {

Edge::Edge(const Vec2& p0, const Vec2& p1, int layer)
    : p0_(p0), p1_(p1), layer_(layer)
{
    Vec2 d = p1_ - p0_;
    double len = d.norm();
    if (len <= 0.0) {
        throw std::invalid_argument("Edge: endpoints must be distinct");
    }
    normal_ = d.perp() / len;
    normal_angle_ = std::atan2(normal_.y, normal_.x);
}

void Edge::flip_normal() {
    normal_ = -normal_;
    normal_angle_ = std::atan2(normal_.y, normal_.x);
}

void Edge::set_in_prob(std::vector<double> in_prob, std::vector<double> cum_prob) {
    if (in_prob.size() != cum_prob.size()) {
        throw std::invalid_argument("Edge: in_prob and cum_prob sizes differ");
    }
    in_prob_ = std::move(in_prob);
    cum_prob_ = std::move(cum_prob);
}

FermiState Edge::sample_injection_index(std::mt19937& rng) const {
    if (cum_prob_.empty()) {
        throw std::logic_error("Edge: injection distribution not set");
    }
    return compute_injection_index(cum_prob_, rng);
}

FermiState Edge::compute_injection_index(const std::vector<double>& cum_prob, std::mt19937& rng) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    double u = uniform(rng);

    // First bin whose cumulative weight exceeds u; empty bins are never chosen
    auto it = std::upper_bound(cum_prob.begin(), cum_prob.end(), u);
    int bin = static_cast<int>(it - cum_prob.begin());
    if (bin >= static_cast<int>(cum_prob.size())) {
        bin = static_cast<int>(cum_prob.size()) - 1;
    }
    return FermiState{bin, 1.0};
}

} // namespace bmc_2d
