#pragma once
#include "core/simulation_config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace bmc_2d {

inline std::string trim_config_token(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }
    if (start == str.length()) {
        return "";
    }

    size_t end = str.length() - 1;
    while (end > start && std::isspace(static_cast<unsigned char>(str[end]))) {
        --end;
    }
    return str.substr(start, end - start + 1);
}

// Whole-token numeric conversion; trailing garbage is an error
inline double parse_config_double(const std::string& token, const std::string& key) {
    const std::string value = trim_config_token(token);
    size_t pos = 0;
    double out = 0.0;
    try {
        out = std::stod(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid number for '" + key + "': '" + token + "'");
    }
    if (pos != value.size()) {
        throw std::invalid_argument("Invalid number for '" + key + "': '" + token + "'");
    }
    return out;
}

inline long long parse_config_integer(const std::string& token, const std::string& key) {
    const std::string value = trim_config_token(token);
    size_t pos = 0;
    long long out = 0;
    try {
        out = std::stoll(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid integer for '" + key + "': '" + token + "'");
    }
    if (pos != value.size()) {
        throw std::invalid_argument("Invalid integer for '" + key + "': '" + token + "'");
    }
    return out;
}

/**
 * @brief Configuration section holding key-value pairs
 *
 * Typed getters return the default for a missing key and throw
 * std::invalid_argument naming the key for a malformed value.
 */
struct ConfigSection {
    std::unordered_map<std::string, std::string> values;

    std::string get(const std::string& key, const std::string& default_val = "") const {
        auto it = values.find(key);
        return (it != values.end()) ? it->second : default_val;
    }

    double get_double(const std::string& key, double default_val = 0.0) const {
        auto it = values.find(key);
        if (it != values.end()) {
            return parse_config_double(it->second, key);
        }
        return default_val;
    }

    int get_int(const std::string& key, int default_val = 0) const {
        auto it = values.find(key);
        if (it != values.end()) {
            return static_cast<int>(parse_config_integer(it->second, key));
        }
        return default_val;
    }

    std::size_t get_size(const std::string& key, std::size_t default_val = 0) const {
        auto it = values.find(key);
        if (it != values.end()) {
            long long v = parse_config_integer(it->second, key);
            if (v < 0) {
                throw std::invalid_argument("Negative count for '" + key + "': '" + it->second + "'");
            }
            return static_cast<std::size_t>(v);
        }
        return default_val;
    }

    bool get_bool(const std::string& key, bool default_val = false) const {
        auto it = values.find(key);
        if (it != values.end()) {
            std::string val = it->second;
            std::transform(val.begin(), val.end(), val.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (val == "true" || val == "1" || val == "yes" || val == "on") return true;
            if (val == "false" || val == "0" || val == "no" || val == "off") return false;
            throw std::invalid_argument("Invalid boolean for '" + key + "': '" + it->second + "'");
        }
        return default_val;
    }

    bool has(const std::string& key) const {
        return values.find(key) != values.end();
    }
};

/**
 * @brief Simple key-value configuration file parser
 *
 * File format (INI-style with sections):
 * ```
 * [device]
 * vertices = 0:0, 1:0, 1:1, 0:1
 * layers = 1, 0, 2, 0
 * grounded_layer = 2
 * injection_layer = 1
 * aux_lines = 0:0.5:1:0.5
 *
 * [fermi_surface]
 * shape = circle
 * n_bins = 100
 * kf = 1.0
 * phi_rad = 0.0
 *
 * [transport]
 * p_scatter = 1.0
 * p_ohmic_absorb = 1.0
 * n_inject = 1000
 * fields = 0.5, 1.0, 2.0
 *
 * [sampling]
 * random_seed = 42
 * ```
 */
class ConfigLoader {
public:
    std::unordered_map<std::string, ConfigSection> sections;

    /**
     * @brief Load configuration from file
     */
    bool load(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            return false;
        }
        return parse(file);
    }

    bool parse(std::istream& in) {
        sections.clear();
        std::string current_section = "default";

        std::string line;
        while (std::getline(in, line)) {
            line = trim_config_token(line);

            // Skip empty lines and comments
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line[0] == '[' && line.back() == ']') {
                current_section = trim_config_token(line.substr(1, line.length() - 2));
                continue;
            }

            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                std::string key = trim_config_token(line.substr(0, pos));
                std::string value = trim_config_token(line.substr(pos + 1));

                // Remove quotes if present
                if (value.size() >= 2 &&
                    ((value.front() == '"' && value.back() == '"') ||
                     (value.front() == '\'' && value.back() == '\''))) {
                    value = value.substr(1, value.length() - 2);
                }

                sections[current_section].values[key] = value;
            }
        }

        return true;
    }

    /**
     * @brief Get section by name
     */
    ConfigSection get_section(const std::string& name) const {
        auto it = sections.find(name);
        if (it != sections.end()) {
            return it->second;
        }
        return ConfigSection{};
    }

    bool has_section(const std::string& name) const {
        return sections.find(name) != sections.end();
    }
};

inline std::vector<std::string> split_config_list(const std::string& raw) {
    std::vector<std::string> tokens;
    std::stringstream ss(raw);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = trim_config_token(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

// "1, 0, 2, 0"
inline std::vector<int> parse_int_list(const std::string& raw, const std::string& key) {
    std::vector<int> out;
    for (const auto& token : split_config_list(raw)) {
        out.push_back(static_cast<int>(parse_config_integer(token, key)));
    }
    return out;
}

// "0.5, 1.0, 2.0"
inline std::vector<double> parse_double_list(const std::string& raw, const std::string& key) {
    std::vector<double> out;
    for (const auto& token : split_config_list(raw)) {
        out.push_back(parse_config_double(token, key));
    }
    return out;
}

// Colon-separated numbers of one list entry, e.g. "0:1.5"
inline std::vector<double> parse_config_tuple(const std::string& token, size_t arity, const std::string& key) {
    std::vector<double> parts;
    std::stringstream ts(token);
    std::string part;
    while (std::getline(ts, part, ':')) {
        parts.push_back(parse_config_double(part, key));
    }
    if (parts.size() != arity) {
        throw std::invalid_argument("Expected " + std::to_string(arity) +
                                    " ':'-separated values for '" + key + "': '" + token + "'");
    }
    return parts;
}

// "x0:y0, x1:y1, ..."
inline std::vector<Vec2> parse_point_list(const std::string& raw, const std::string& key) {
    std::vector<Vec2> out;
    for (const auto& token : split_config_list(raw)) {
        std::vector<double> p = parse_config_tuple(token, 2, key);
        out.emplace_back(p[0], p[1]);
    }
    return out;
}

// "x0:y0:x1:y1, ..."
inline std::vector<std::pair<Vec2, Vec2>> parse_segment_list(const std::string& raw, const std::string& key) {
    std::vector<std::pair<Vec2, Vec2>> out;
    for (const auto& token : split_config_list(raw)) {
        std::vector<double> p = parse_config_tuple(token, 4, key);
        out.emplace_back(Vec2(p[0], p[1]), Vec2(p[2], p[3]));
    }
    return out;
}

inline std::string serialize_point_list(const std::vector<Vec2>& points) {
    std::ostringstream oss;
    oss << std::setprecision(17);
    for (size_t i = 0; i < points.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << points[i].x << ":" << points[i].y;
    }
    return oss.str();
}

inline std::string serialize_segment_list(const std::vector<std::pair<Vec2, Vec2>>& segments) {
    std::ostringstream oss;
    oss << std::setprecision(17);
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << segments[i].first.x << ":" << segments[i].first.y << ":"
            << segments[i].second.x << ":" << segments[i].second.y;
    }
    return oss.str();
}

template <typename T>
inline std::string serialize_list(const std::vector<T>& values) {
    std::ostringstream oss;
    oss << std::setprecision(17);
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << values[i];
    }
    return oss.str();
}

/**
 * @brief Build a SimulationConfig from parsed sections
 *
 * Missing keys keep their defaults. The result is not validated.
 */
inline SimulationConfig simulation_config_from_loader(const ConfigLoader& loader) {
    SimulationConfig config;

    // [device] section
    ConfigSection device_sec = loader.get_section("device");
    if (device_sec.has("vertices")) {
        config.device.vertices = parse_point_list(device_sec.get("vertices"), "vertices");
    }
    if (device_sec.has("layers")) {
        config.device.layers = parse_int_list(device_sec.get("layers"), "layers");
    }
    config.device.grounded_layer = device_sec.get_int("grounded_layer", config.device.grounded_layer);
    config.device.injection_layer = device_sec.get_int("injection_layer", config.device.injection_layer);
    if (device_sec.has("aux_lines")) {
        config.device.aux_lines = parse_segment_list(device_sec.get("aux_lines"), "aux_lines");
    }

    // [fermi_surface] section
    ConfigSection fermi_sec = loader.get_section("fermi_surface");
    if (fermi_sec.has("shape")) {
        config.fermi_surface.shape = string_to_fermi_surface_shape(fermi_sec.get("shape"));
    }
    config.fermi_surface.n_bins = fermi_sec.get_int("n_bins", config.fermi_surface.n_bins);
    config.fermi_surface.kf = fermi_sec.get_double("kf", config.fermi_surface.kf);
    config.fermi_surface.kf_minor = fermi_sec.get_double("kf_minor", config.fermi_surface.kf_minor);
    if (fermi_sec.has("points")) {
        config.fermi_surface.points = parse_point_list(fermi_sec.get("points"), "points");
    }
    config.fermi_surface.phi = fermi_sec.get_double("phi_rad", config.fermi_surface.phi);

    // [transport] section
    ConfigSection transport_sec = loader.get_section("transport");
    config.transport.p_scatter = transport_sec.get_double("p_scatter", config.transport.p_scatter);
    config.transport.p_ohmic_absorb = transport_sec.get_double("p_ohmic_absorb", config.transport.p_ohmic_absorb);
    config.transport.n_inject = transport_sec.get_size("n_inject", config.transport.n_inject);
    config.transport.max_steps = transport_sec.get_size("max_steps", config.transport.max_steps);
    config.transport.intersection_bias = transport_sec.get_double("intersection_bias", config.transport.intersection_bias);
    config.transport.corner_tolerance = transport_sec.get_double("corner_tolerance", config.transport.corner_tolerance);
    config.transport.debug = transport_sec.get_bool("debug", config.transport.debug);
    if (transport_sec.has("fields")) {
        config.transport.fields = parse_double_list(transport_sec.get("fields"), "fields");
    }

    // [sampling] section
    ConfigSection sampling_sec = loader.get_section("sampling");
    config.sampling.random_seed = static_cast<unsigned int>(
        sampling_sec.get_size("random_seed", config.sampling.random_seed));

    // [output] section
    ConfigSection output_sec = loader.get_section("output");
    config.output.output_dir = output_sec.get("output_dir", config.output.output_dir);
    config.output.counts_file = output_sec.get("counts_file", config.output.counts_file);
    config.output.layer_stats_file = output_sec.get("layer_stats_file", config.output.layer_stats_file);
    config.output.trajectories_file = output_sec.get("trajectories_file", config.output.trajectories_file);
    config.output.save_trajectories = output_sec.get_bool("save_trajectories", config.output.save_trajectories);
    config.output.use_cache = output_sec.get_bool("use_cache", config.output.use_cache);
    config.output.cache_dir = output_sec.get("cache_dir", config.output.cache_dir);
    config.output.identifier = output_sec.get("identifier", config.output.identifier);
    config.output.stored_states = output_sec.get("stored_states", config.output.stored_states);

    // [logging] section
    ConfigSection logging_sec = loader.get_section("logging");
    config.logging.level = logging_sec.get("level", config.logging.level);
    config.logging.colors = logging_sec.get_bool("colors", config.logging.colors);

    return config;
}

/**
 * @brief Load SimulationConfig from file
 */
inline SimulationConfig load_simulation_config(const std::string& filename) {
    ConfigLoader loader;
    if (!loader.load(filename)) {
        throw std::runtime_error("Failed to load configuration file: " + filename);
    }
    return simulation_config_from_loader(loader);
}

/**
 * @brief Save SimulationConfig to file
 */
inline bool save_simulation_config(const std::string& filename, const SimulationConfig& config) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    file << std::setprecision(17);

    file << "# Ballistic Monte Carlo configuration\n";
    file << "# Auto-generated by BMC_2D\n\n";

    file << "[device]\n";
    file << "vertices = " << serialize_point_list(config.device.vertices) << "\n";
    file << "layers = " << serialize_list(config.device.layers) << "\n";
    file << "grounded_layer = " << config.device.grounded_layer << "\n";
    file << "injection_layer = " << config.device.injection_layer << "\n";
    if (!config.device.aux_lines.empty()) {
        file << "aux_lines = " << serialize_segment_list(config.device.aux_lines) << "\n";
    }
    file << "\n";

    file << "[fermi_surface]\n";
    file << "shape = " << fermi_surface_shape_to_string(config.fermi_surface.shape) << "\n";
    file << "n_bins = " << config.fermi_surface.n_bins << "\n";
    file << "kf = " << config.fermi_surface.kf << "\n";
    file << "kf_minor = " << config.fermi_surface.kf_minor << "\n";
    if (!config.fermi_surface.points.empty()) {
        file << "points = " << serialize_point_list(config.fermi_surface.points) << "\n";
    }
    file << "phi_rad = " << config.fermi_surface.phi << "\n\n";

    file << "[transport]\n";
    file << "p_scatter = " << config.transport.p_scatter << "\n";
    file << "p_ohmic_absorb = " << config.transport.p_ohmic_absorb << "\n";
    file << "n_inject = " << config.transport.n_inject << "\n";
    file << "max_steps = " << config.transport.max_steps << "\n";
    file << "intersection_bias = " << config.transport.intersection_bias << "\n";
    file << "corner_tolerance = " << config.transport.corner_tolerance << "\n";
    file << "debug = " << (config.transport.debug ? "true" : "false") << "\n";
    file << "fields = " << serialize_list(config.transport.fields) << "\n\n";

    file << "[sampling]\n";
    file << "random_seed = " << config.sampling.random_seed << "\n\n";

    file << "[output]\n";
    file << "output_dir = " << config.output.output_dir << "\n";
    file << "counts_file = " << config.output.counts_file << "\n";
    file << "layer_stats_file = " << config.output.layer_stats_file << "\n";
    file << "trajectories_file = " << config.output.trajectories_file << "\n";
    file << "save_trajectories = " << (config.output.save_trajectories ? "true" : "false") << "\n";
    file << "use_cache = " << (config.output.use_cache ? "true" : "false") << "\n";
    file << "cache_dir = " << config.output.cache_dir << "\n";
    file << "identifier = " << config.output.identifier << "\n";
    file << "stored_states = " << config.output.stored_states << "\n\n";

    file << "[logging]\n";
    file << "level = " << config.logging.level << "\n";
    file << "colors = " << (config.logging.colors ? "true" : "false") << "\n";

    return true;
}

/**
 * @brief Print configuration summary to stream
 */
inline void print_config_summary(std::ostream& os, const SimulationConfig& config) {
    os << "=== Ballistic Monte Carlo Configuration ===\n";
    os << "Device: " << config.device.vertices.size() << " edges, layers ["
       << serialize_list(config.device.layers) << "]\n";
    os << "Contacts: injection layer " << config.device.injection_layer
       << ", grounded layer " << config.device.grounded_layer << "\n";
    if (!config.device.aux_lines.empty()) {
        os << "Auxiliary lines: " << config.device.aux_lines.size() << "\n";
    }
    os << "Fermi surface: " << fermi_surface_shape_to_string(config.fermi_surface.shape);
    switch (config.fermi_surface.shape) {
        case FermiSurfaceShape::CIRCLE:
            os << " (kf=" << config.fermi_surface.kf << ", " << config.fermi_surface.n_bins << " bins)";
            break;
        case FermiSurfaceShape::ELLIPSE:
            os << " (kf=" << config.fermi_surface.kf << ", kf_minor=" << config.fermi_surface.kf_minor
               << ", " << config.fermi_surface.n_bins << " bins)";
            break;
        case FermiSurfaceShape::POINTS:
            os << " (" << config.fermi_surface.points.size() << " points)";
            break;
    }
    os << ", phi=" << config.fermi_surface.phi << " rad\n";
    os << "Transport: p_scatter=" << config.transport.p_scatter
       << ", p_ohmic_absorb=" << config.transport.p_ohmic_absorb
       << ", n_inject=" << config.transport.n_inject
       << ", max_steps=" << config.transport.max_steps
       << ", debug=" << (config.transport.debug ? "on" : "off") << "\n";
    os << "Fields: " << serialize_list(config.transport.fields) << "\n";
    os << "Seed: " << config.sampling.random_seed << "\n";
    os << "Output Dir: " << config.output.output_dir;
    if (config.output.use_cache) {
        os << " (cache " << config.output.cache_dir << "/" << config.output.identifier << ")";
    }
    os << "\n";
    os << "===========================================\n";
}

} // namespace bmc_2d
