#pragma once
#include "core/types.hpp"
#include "transport/trajectory.hpp"
#include "utils/logger.hpp"
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace bmc_2d {

/**
 * @brief Fermi surface parameterization
 */
enum class FermiSurfaceShape {
    CIRCLE,     // Isotropic, radius kf
    ELLIPSE,    // Semi-axes kf (x) and kf_minor (y)
    POINTS      // Explicit k-space polygon
};

inline std::string fermi_surface_shape_to_string(FermiSurfaceShape shape) {
    switch (shape) {
        case FermiSurfaceShape::CIRCLE:  return "circle";
        case FermiSurfaceShape::ELLIPSE: return "ellipse";
        case FermiSurfaceShape::POINTS:  return "points";
        default:                         return "circle";
    }
}

inline FermiSurfaceShape string_to_fermi_surface_shape(const std::string& str) {
    if (str == "circle")  return FermiSurfaceShape::CIRCLE;
    if (str == "ellipse") return FermiSurfaceShape::ELLIPSE;
    if (str == "points")  return FermiSurfaceShape::POINTS;
    throw std::invalid_argument("Unknown Fermi surface shape: " + str);
}

/**
 * @brief Device polygon and contact assignment
 */
struct DeviceConfig {
    // Unit square, edges bottom, right, top, left
    std::vector<Vec2> vertices = {{0.0, 0.0}, {1.0, 0.0}, {1.0, 1.0}, {0.0, 1.0}};
    std::vector<int> layers = {1, 0, 2, 0};
    int grounded_layer = 2;
    int injection_layer = 1;
    std::vector<std::pair<Vec2, Vec2>> aux_lines;  // Counting lines only
};

struct FermiSurfaceConfig {
    FermiSurfaceShape shape = FermiSurfaceShape::CIRCLE;
    int n_bins = 100;
    double kf = 1.0;
    double kf_minor = 1.0;          // ELLIPSE only
    std::vector<Vec2> points;       // POINTS only
    double phi = 0.0;               // Crystal axis angle (rad)
};

struct TransportConfig {
    double p_scatter = 1.0;
    double p_ohmic_absorb = 1.0;
    std::size_t n_inject = 1000;
    std::size_t max_steps = 0;      // 0 = unbounded
    double intersection_bias = 1e-10;
    double corner_tolerance = 1e-12;
    bool debug = false;             // Out-of-device checks before every step
    std::vector<double> fields = {1.0};
};

struct SamplingConfig {
    unsigned int random_seed = 42;
};

struct OutputConfig {
    std::string output_dir = "results";
    std::string counts_file = "counts.txt";
    std::string layer_stats_file = "layer_stats.txt";
    std::string trajectories_file = "trajectories.txt";
    bool save_trajectories = false;
    bool use_cache = false;
    std::string cache_dir = "cache";
    std::string identifier = "bmc";
    std::string stored_states = "all";
};

struct LoggingConfig {
    std::string level = "info";
    bool colors = true;
};

/**
 * @brief Complete description of a field sweep
 */
struct SimulationConfig {
    DeviceConfig device;
    FermiSurfaceConfig fermi_surface;
    TransportConfig transport;
    SamplingConfig sampling;
    OutputConfig output;
    LoggingConfig logging;

    void validate() const;
};

inline void SimulationConfig::validate() const {
    // Device
    if (device.vertices.size() < 3) {
        throw std::invalid_argument("SimulationConfig: device needs at least 3 vertices");
    }
    if (device.layers.size() != device.vertices.size()) {
        throw std::invalid_argument("SimulationConfig: device.layers must have one entry per vertex");
    }
    if (device.grounded_layer == 0) {
        throw std::invalid_argument("SimulationConfig: grounded_layer cannot be the device boundary layer 0");
    }
    if (device.injection_layer == 0) {
        throw std::invalid_argument("SimulationConfig: injection_layer cannot be the device boundary layer 0");
    }
    bool has_injection = false;
    for (int layer : device.layers) {
        if (layer < 0) {
            throw std::invalid_argument("SimulationConfig: layers must be non-negative");
        }
        if (layer == device.injection_layer) {
            has_injection = true;
        }
    }
    if (!has_injection) {
        throw std::invalid_argument("SimulationConfig: no edge on injection_layer");
    }
    for (const auto& line : device.aux_lines) {
        if (line.first == line.second) {
            throw std::invalid_argument("SimulationConfig: auxiliary line endpoints must be distinct");
        }
    }

    // Fermi surface
    switch (fermi_surface.shape) {
        case FermiSurfaceShape::ELLIPSE:
            if (fermi_surface.kf_minor <= 0.0) {
                throw std::invalid_argument("SimulationConfig: kf_minor must be positive");
            }
            // fall through
        case FermiSurfaceShape::CIRCLE:
            if (fermi_surface.n_bins < 3) {
                throw std::invalid_argument("SimulationConfig: n_bins must be at least 3");
            }
            if (fermi_surface.kf <= 0.0) {
                throw std::invalid_argument("SimulationConfig: kf must be positive");
            }
            break;
        case FermiSurfaceShape::POINTS:
            if (fermi_surface.points.size() < 3) {
                throw std::invalid_argument("SimulationConfig: Fermi surface needs at least 3 points");
            }
            break;
    }
    if (!std::isfinite(fermi_surface.phi)) {
        throw std::invalid_argument("SimulationConfig: phi must be finite");
    }

    // Transport
    if (transport.p_scatter < 0.0 || transport.p_scatter > 1.0) {
        throw std::invalid_argument("SimulationConfig: p_scatter must be in [0,1]");
    }
    if (transport.p_ohmic_absorb < 0.0 || transport.p_ohmic_absorb > 1.0) {
        throw std::invalid_argument("SimulationConfig: p_ohmic_absorb must be in [0,1]");
    }
    if (transport.n_inject == 0) {
        throw std::invalid_argument("SimulationConfig: n_inject must be positive");
    }
    if (transport.intersection_bias < 0.0) {
        throw std::invalid_argument("SimulationConfig: intersection_bias cannot be negative");
    }
    if (transport.corner_tolerance < 0.0) {
        throw std::invalid_argument("SimulationConfig: corner_tolerance cannot be negative");
    }
    if (transport.fields.empty()) {
        throw std::invalid_argument("SimulationConfig: at least one field is required");
    }
    for (double b : transport.fields) {
        if (b == 0.0 || !std::isfinite(b)) {
            throw std::invalid_argument("SimulationConfig: fields must be finite and non-zero");
        }
    }

    // Output
    if (output.use_cache && output.identifier.empty()) {
        throw std::invalid_argument("SimulationConfig: identifier is required when use_cache is on");
    }
    StoredStates::parse(output.stored_states);

    // Logging
    string_to_log_level(logging.level);
}

} // namespace bmc_2d
