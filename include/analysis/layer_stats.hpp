#pragma once
#include "geometry/aux_lines.hpp"
#include "geometry/frame.hpp"
#include "transport/simulation.hpp"
#include <map>
#include <string>
#include <vector>

namespace bmc_2d {

// layer -> total count
using LayerCounts = std::map<int, long long>;

// layer -> one total per run
using LayerStats = std::map<int, std::vector<double>>;

/**
 * @brief Sum a result's counts per layer
 *
 * Auxiliary lines contribute under their own layers, so `lines` must be the
 * set the result was produced with (Simulation::aux_lines(), already offset).
 *
 * @throws std::invalid_argument if the counts do not match the geometry
 */
LayerCounts layer_counts(const SimulationResult& result, const Frame& frame, const AuxiliaryLines& lines);

/**
 * @brief Per-layer totals across a series of runs, e.g. a field sweep
 *
 * Every layer seen in any run gets a vector with one entry per run, zero where
 * the layer received no count.
 */
LayerStats calc_layer_stats(const std::vector<SimulationResult>& results, const Frame& frame, const AuxiliaryLines& lines);

// Table with one row per run: field, then one column per layer
bool save_layer_stats(const std::string& path, const std::vector<double>& fields, const LayerStats& stats);

} // namespace bmc_2d
