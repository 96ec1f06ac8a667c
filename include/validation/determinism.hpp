#pragma once
#include "band/bandstructure.hpp"
#include "geometry/aux_lines.hpp"
#include "geometry/frame.hpp"
#include "transport/simulation.hpp"
#include <cstddef>
#include <cstdint>

namespace bmc_2d {

// Folds counts, summary fields and every waypoint bit pattern
uint32_t compute_checksum(const SimulationResult& result);

// Run two fresh Simulations with identical inputs and compare checksums
bool verify_determinism(
    const Frame& frame,
    const Bandstructure& band,
    const SimulationParams& params,
    const AuxiliaryLines& lines,
    std::size_t n_inject
);

} // namespace bmc_2d
