#include "transport/reflection.hpp"
#include "geometry/segment_table.hpp"
#include "utils/logger.hpp"
#include <cmath>
#include <limits>

namespace bmc_2d {

namespace {
    // Crossings closer than this (relative to the chord length) to the current
    // Fermi point are the current point itself
    constexpr double kCoincidentTolerance = 1e-9;
}

std::vector<FermiCrossing> fermi_intersections(
    const Bandstructure& band,
    const FermiState& n_f,
    const Vec2& edge_direction
) {
    std::vector<FermiCrossing> out;
    const Vec2 c = band.fermi_point(n_f);

    for (int j = 0; j < band.n_bins(); ++j) {
        const Vec2& a = band.r_at(j);
        const Vec2& d = band.dr_at(j);
        const double denom = d.cross(edge_direction);
        if (denom == 0.0) {
            continue;
        }
        const double s = (c - a).cross(edge_direction) / denom;
        if (s < 0.0 || s > 1.0) {
            continue;
        }
        out.push_back({FermiState{j, 1.0 - s}, a + s * d});
    }
    return out;
}

FermiState specular(const Bandstructure& band, const FermiState& n_f, const Edge& edge) {
    const Vec2 c = band.fermi_point(n_f);
    const std::vector<FermiCrossing> crossings = fermi_intersections(band, n_f, edge.direction());

    bool found = false;
    double min_distance = std::numeric_limits<double>::infinity();
    FermiState reflected;
    for (const auto& crossing : crossings) {
        const int j = crossing.n_f.bin;
        if (j == n_f.bin) {
            continue;
        }
        if ((crossing.point - c).norm() <= kCoincidentTolerance * band.dr_at(j).norm()) {
            continue;
        }
        const double distance = (c - band.r_at(j)).norm();
        if (distance < min_distance) {
            min_distance = distance;
            reflected = crossing.n_f;
            found = true;
        }
    }

    if (!found) {
        throw ReflectionError(
            "no specular reflection target from bin " + std::to_string(n_f.bin) +
            " (frac " + std::to_string(n_f.frac) + ") off edge at normal angle " +
            std::to_string(edge.normal_angle()));
    }
    return reflected;
}

FermiState scatter(const Edge& edge, std::mt19937& rng) {
    return edge.sample_injection_index(rng);
}

std::optional<InjectionProbability> corner_in_prob(const Edge& edge_0, const Edge& edge_1) {
    const auto& p0 = edge_0.in_prob();
    const auto& p1 = edge_1.in_prob();
    if (p0.size() != p1.size() || p0.empty()) {
        throw std::invalid_argument("corner_in_prob: edges carry incompatible injection distributions");
    }

    InjectionProbability out;
    out.in_prob.resize(p0.size());
    out.cum_prob.resize(p0.size());

    double total = 0.0;
    for (size_t i = 0; i < p0.size(); ++i) {
        out.in_prob[i] = p0[i] * p1[i];
        total += out.in_prob[i];
    }
    if (!(total > 0.0)) {
        return std::nullopt;
    }

    double acc = 0.0;
    for (size_t i = 0; i < p0.size(); ++i) {
        out.in_prob[i] /= total;
        acc += out.in_prob[i];
        out.cum_prob[i] = acc;
    }
    out.cum_prob.back() = 1.0;
    return out;
}

FermiState corner_scatter(const Edge& edge_0, const Edge& edge_1, const Edge& counted, std::mt19937& rng) {
    std::optional<InjectionProbability> joint = corner_in_prob(edge_0, edge_1);
    if (!joint) {
        Logger::get().warn("Corner edges share no injecting bin, scattering off layer %d only", counted.layer());
        return counted.sample_injection_index(rng);
    }
    return Edge::compute_injection_index(joint->cum_prob, rng);
}

std::optional<Edge> corner_virtual_edge(const Edge& edge_0, const Edge& edge_1, const Vec2& origin, int layer) {
    Vec2 corner;
    if (!line_intersection(edge_0.p0(), edge_0.p1(), edge_1.p0(), edge_1.p1(), corner)) {
        return std::nullopt;
    }

    // Unit direction along each edge line, oriented toward the origin side
    Vec2 d0 = edge_0.direction().normalized();
    Vec2 d1 = edge_1.direction().normalized();
    const Vec2 to_origin = origin - corner;
    if (d0.dot(to_origin) < 0.0) d0 = -d0;
    if (d1.dot(to_origin) < 0.0) d1 = -d1;

    const Vec2 median = (corner + d0 + corner + d1) * 0.5;
    const Vec2 m = median - corner;
    if (m.norm2() == 0.0) {
        return std::nullopt;
    }

    // Left-hand normal of (corner -> corner - m.perp()) is m
    return Edge(corner, corner - m.perp(), layer);
}

FermiState corner_specular(
    const Bandstructure& band,
    const FermiState& n_f,
    const Edge& edge_0,
    const Edge& edge_1,
    const Edge& counted,
    const Vec2& origin
) {
    std::optional<Edge> virtual_edge = corner_virtual_edge(edge_0, edge_1, origin, counted.layer());
    if (!virtual_edge) {
        return specular(band, n_f, counted);
    }
    return specular(band, n_f, *virtual_edge);
}

} // namespace bmc_2d
