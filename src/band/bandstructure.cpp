#include "band/bandstructure.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace bmc_2d {

Bandstructure::Bandstructure(const std::vector<Vec2>& k, double phi, double field)
    : phi_(phi), field_(field)
{
    if (field == 0.0 || !std::isfinite(field)) {
        throw std::invalid_argument("Bandstructure: field must be finite and non-zero");
    }

    std::vector<Vec2> points = k;
    if (points.size() >= 2 && points.front() == points.back()) {
        points.pop_back();
    }
    if (points.size() < 3) {
        throw std::invalid_argument("Bandstructure: Fermi surface needs at least 3 points");
    }
    if (field < 0.0) {
        std::reverse(points.begin(), points.end());
    }

    const double c = std::cos(phi);
    const double s = std::sin(phi);
    const double inv_b = 1.0 / std::abs(field);

    r_.reserve(points.size() + 1);
    for (const auto& kp : points) {
        Vec2 kr(c * kp.x - s * kp.y, s * kp.x + c * kp.y);
        r_.emplace_back(kr.y * inv_b, -kr.x * inv_b);
    }
    r_.push_back(r_.front());

    dr_.reserve(points.size());
    for (size_t i = 0; i + 1 < r_.size(); ++i) {
        dr_.push_back(r_[i + 1] - r_[i]);
    }
}

Vec2 Bandstructure::fermi_point(const FermiState& n_f) const {
    return r_[n_f.bin] + (1.0 - n_f.frac) * dr_[n_f.bin];
}

InjectionProbability Bandstructure::calculate_injection_prob(double normal_angle) const {
    const Vec2 n(std::cos(normal_angle), std::sin(normal_angle));

    InjectionProbability out;
    out.in_prob.resize(dr_.size());
    out.cum_prob.resize(dr_.size());

    double total = 0.0;
    for (size_t i = 0; i < dr_.size(); ++i) {
        double flux = dr_[i].dot(n);
        out.in_prob[i] = flux > 0.0 ? flux : 0.0;
        total += out.in_prob[i];
    }
    if (!(total > 0.0)) {
        throw std::invalid_argument("Bandstructure: no Fermi bin injects through this boundary");
    }

    double acc = 0.0;
    for (size_t i = 0; i < dr_.size(); ++i) {
        out.in_prob[i] /= total;
        acc += out.in_prob[i];
        out.cum_prob[i] = acc;
    }
    out.cum_prob.back() = 1.0;
    return out;
}

std::vector<Vec2> Bandstructure::circular_fermi_surface(int n_bins, double kf) {
    return elliptical_fermi_surface(n_bins, kf, kf);
}

std::vector<Vec2> Bandstructure::elliptical_fermi_surface(int n_bins, double ka, double kb) {
    if (n_bins < 3) {
        throw std::invalid_argument("Bandstructure: n_bins must be at least 3");
    }
    if (ka <= 0.0 || kb <= 0.0) {
        throw std::invalid_argument("Bandstructure: Fermi wave vectors must be positive");
    }
    std::vector<Vec2> k;
    k.reserve(n_bins);
    for (int i = 0; i < n_bins; ++i) {
        double theta = 2.0 * M_PI * i / n_bins;
        k.emplace_back(ka * std::cos(theta), kb * std::sin(theta));
    }
    return k;
}

} // namespace bmc_2d
