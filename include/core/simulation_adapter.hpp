#pragma once
#include "band/bandstructure.hpp"
#include "core/simulation_config.hpp"
#include "geometry/aux_lines.hpp"
#include "geometry/frame.hpp"
#include "transport/simulation.hpp"
#include "transport/trajectory.hpp"
#include <array>
#include <utility>
#include <vector>

namespace bmc_2d {

/**
 * @brief Adapters from SimulationConfig to the transport types
 */

inline Frame make_frame(const DeviceConfig& device) {
    return Frame(device.vertices, device.layers);
}

inline AuxiliaryLines make_aux_lines(const DeviceConfig& device) {
    return AuxiliaryLines::from_segments(device.aux_lines);
}

inline std::vector<Vec2> make_fermi_surface(const FermiSurfaceConfig& fs) {
    switch (fs.shape) {
        case FermiSurfaceShape::ELLIPSE:
            return Bandstructure::elliptical_fermi_surface(fs.n_bins, fs.kf, fs.kf_minor);
        case FermiSurfaceShape::POINTS:
            return fs.points;
        case FermiSurfaceShape::CIRCLE:
        default:
            return Bandstructure::circular_fermi_surface(fs.n_bins, fs.kf);
    }
}

inline Bandstructure make_bandstructure(const FermiSurfaceConfig& fs, double field) {
    return Bandstructure(make_fermi_surface(fs), fs.phi, field);
}

inline SimulationParams make_params(const SimulationConfig& config) {
    SimulationParams params;
    params.p_scatter = config.transport.p_scatter;
    params.p_ohmic_absorb = config.transport.p_ohmic_absorb;
    params.grounded_layer = config.device.grounded_layer;
    params.injection_layer = config.device.injection_layer;
    params.random_seed = config.sampling.random_seed;
    params.max_steps = config.transport.max_steps;
    params.intersection_bias = config.transport.intersection_bias;
    params.corner_tolerance = config.transport.corner_tolerance;
    return params;
}

inline StoredStates make_stored_states(const OutputConfig& output) {
    return StoredStates::parse(output.stored_states);
}

/**
 * @brief Builder class for fluent configuration construction
 */
class SimulationConfigBuilder {
public:
    SimulationConfig config;

    SimulationConfigBuilder& device(const std::vector<Vec2>& vertices, const std::vector<int>& layers) {
        config.device.vertices = vertices;
        config.device.layers = layers;
        return *this;
    }

    // Layers are bottom, right, top, left
    SimulationConfigBuilder& rectangle(double width, double height, const std::array<int, 4>& layers) {
        config.device.vertices = {{0.0, 0.0}, {width, 0.0}, {width, height}, {0.0, height}};
        config.device.layers.assign(layers.begin(), layers.end());
        return *this;
    }

    SimulationConfigBuilder& grounded_layer(int layer) {
        config.device.grounded_layer = layer;
        return *this;
    }

    SimulationConfigBuilder& injection_layer(int layer) {
        config.device.injection_layer = layer;
        return *this;
    }

    SimulationConfigBuilder& aux_line(const Vec2& a, const Vec2& b) {
        config.device.aux_lines.emplace_back(a, b);
        return *this;
    }

    SimulationConfigBuilder& circular_fermi_surface(int n_bins, double kf) {
        config.fermi_surface.shape = FermiSurfaceShape::CIRCLE;
        config.fermi_surface.n_bins = n_bins;
        config.fermi_surface.kf = kf;
        return *this;
    }

    SimulationConfigBuilder& elliptical_fermi_surface(int n_bins, double kf, double kf_minor) {
        config.fermi_surface.shape = FermiSurfaceShape::ELLIPSE;
        config.fermi_surface.n_bins = n_bins;
        config.fermi_surface.kf = kf;
        config.fermi_surface.kf_minor = kf_minor;
        return *this;
    }

    SimulationConfigBuilder& fermi_points(const std::vector<Vec2>& points) {
        config.fermi_surface.shape = FermiSurfaceShape::POINTS;
        config.fermi_surface.points = points;
        return *this;
    }

    SimulationConfigBuilder& crystal_angle(double phi) {
        config.fermi_surface.phi = phi;
        return *this;
    }

    SimulationConfigBuilder& p_scatter(double p) {
        config.transport.p_scatter = p;
        return *this;
    }

    SimulationConfigBuilder& p_ohmic_absorb(double p) {
        config.transport.p_ohmic_absorb = p;
        return *this;
    }

    SimulationConfigBuilder& injections(std::size_t n) {
        config.transport.n_inject = n;
        return *this;
    }

    SimulationConfigBuilder& max_steps(std::size_t n) {
        config.transport.max_steps = n;
        return *this;
    }

    SimulationConfigBuilder& fields(const std::vector<double>& b) {
        config.transport.fields = b;
        return *this;
    }

    SimulationConfigBuilder& seed(unsigned int s) {
        config.sampling.random_seed = s;
        return *this;
    }

    SimulationConfigBuilder& output_dir(const std::string& dir) {
        config.output.output_dir = dir;
        return *this;
    }

    SimulationConfig build() const {
        SimulationConfig result = config;
        result.validate();
        return result;
    }
};

/**
 * @brief Convenience functions for common preset configurations
 */
namespace presets {

// Unit square, source at the bottom, grounded drain at the top
inline SimulationConfig square_two_terminal() {
    SimulationConfig config;
    config.device.vertices = {{0.0, 0.0}, {1.0, 0.0}, {1.0, 1.0}, {0.0, 1.0}};
    config.device.layers = {1, 0, 2, 0};
    config.fermi_surface.shape = FermiSurfaceShape::CIRCLE;
    config.fermi_surface.n_bins = 100;
    config.fermi_surface.kf = 0.5;
    config.transport.fields = {1.0};
    return config;
}

// Unit square with a floating contact on the right edge
inline SimulationConfig square_floating_contact() {
    SimulationConfig config = square_two_terminal();
    config.device.layers = {1, 3, 0, 2};
    config.transport.p_ohmic_absorb = 0.5;
    return config;
}

// 3 x 1 bar with source and drain at the ends and two counting lines
inline SimulationConfig hall_bar() {
    SimulationConfig config;
    config.device.vertices = {{0.0, 0.0}, {3.0, 0.0}, {3.0, 1.0}, {0.0, 1.0}};
    config.device.layers = {0, 2, 0, 1};
    config.device.aux_lines = {{{1.0, 0.0}, {1.0, 1.0}}, {{2.0, 0.0}, {2.0, 1.0}}};
    config.fermi_surface.shape = FermiSurfaceShape::CIRCLE;
    config.fermi_surface.n_bins = 200;
    config.fermi_surface.kf = 1.0;
    config.transport.fields = {0.25, 0.5, 1.0, 2.0};
    return config;
}

} // namespace presets

} // namespace bmc_2d
