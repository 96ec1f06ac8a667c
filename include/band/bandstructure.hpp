#pragma once
#include "core/types.hpp"
#include <vector>

namespace bmc_2d {

/**
 * @brief Injection distribution over Fermi bins for one boundary orientation
 */
struct InjectionProbability {
    std::vector<double> in_prob;   // Normalized weight per bin
    std::vector<double> cum_prob;  // Running sum, last entry exactly 1
};

/**
 * @brief Discretized Fermi surface mapped to a real-space cyclotron orbit
 *
 * The input k-space curve is rotated by the crystal angle phi and turned
 * into the real-space orbit r = (k_y, -k_x) / |B|. A negative field reverses
 * the traversal order. r is closed (r[N] == r[0]) and chord i,
 * dr[i] = r[i+1] - r[i], is the displacement of one full step from bin i.
 */
class Bandstructure {
public:
    Bandstructure(const std::vector<Vec2>& k, double phi, double field);

    int n_bins() const { return static_cast<int>(dr_.size()); }
    double phi() const { return phi_; }
    double field() const { return field_; }

    const std::vector<Vec2>& r() const { return r_; }
    const std::vector<Vec2>& dr() const { return dr_; }
    const Vec2& r_at(int bin) const { return r_[bin]; }
    const Vec2& dr_at(int bin) const { return dr_[bin]; }

    // Orbit coordinate of a Fermi state: r[bin] + (1 - frac) * dr[bin]
    Vec2 fermi_point(const FermiState& n_f) const;

    /**
     * @brief Injection probabilities for a boundary whose inward normal has
     *        angle normal_angle
     *
     * Weight of bin i is the flux into the device, max(0, dr[i] . n).
     */
    InjectionProbability calculate_injection_prob(double normal_angle) const;

    static std::vector<Vec2> circular_fermi_surface(int n_bins, double kf);
    static std::vector<Vec2> elliptical_fermi_surface(int n_bins, double ka, double kb);

private:
    double phi_;
    double field_;
    std::vector<Vec2> r_;
    std::vector<Vec2> dr_;
};

} // namespace bmc_2d
