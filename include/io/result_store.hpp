#pragma once
#include "geometry/aux_lines.hpp"
#include "geometry/frame.hpp"
#include "transport/simulation.hpp"
#include "transport/trajectory.hpp"
#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

namespace bmc_2d {

// Version tag written at the top of every stored result
constexpr int kResultFormatVersion = 1;

// Create a directory if it doesn't exist; true if it exists afterwards
bool create_output_directory(const std::string& path);

bool file_exists(const std::string& path);

/**
 * @brief Versioned text serialization of a SimulationResult
 *
 * Doubles are written with 17 significant digits so a load reproduces the
 * saved result bit for bit.
 */
void write_result(std::ostream& out, const SimulationResult& result);

// Throws std::runtime_error on a malformed or foreign stream
SimulationResult read_result(std::istream& in);

bool save_result(const std::string& path, const SimulationResult& result);

// Throws std::runtime_error if the file cannot be opened or parsed
SimulationResult load_result(const std::string& path);

// dir/identifier.bmc
std::string cache_path(const std::string& dir, const std::string& identifier);

/**
 * @brief Run a simulation unless a cached result exists
 *
 * Loads dir/identifier.bmc when present, otherwise runs the simulation and
 * stores its result there.
 */
SimulationResult run_simulation_with_cache(
    Simulation& sim,
    const std::string& identifier,
    std::size_t n_inject,
    const std::string& dir,
    const StoredStates& stored = StoredStates::all(),
    bool debug = false
);

/**
 * @brief Save per-edge and per-line counts as a table
 *
 * One row per edge (kind, index, layer, endpoints, count), then one row per
 * auxiliary line with its offset layer.
 */
bool save_counts(const std::string& path, const SimulationResult& result,
                 const Frame& frame, const AuxiliaryLines& lines);

// One row per stored waypoint, trajectories separated by blank lines
bool save_trajectories(const std::string& path, const SimulationResult& result);

} // namespace bmc_2d
