#include "validation/determinism.hpp"
#include <cstdint>
#include <cstring>

namespace bmc_2d {

namespace {
    inline uint32_t fold(uint64_t bits) {
        return static_cast<uint32_t>(bits ^ (bits >> 32));
    }

    inline uint32_t fold_double(double val) {
        uint64_t bits;
        std::memcpy(&bits, &val, sizeof(double));
        return fold(bits);
    }

    // Order-sensitive mix so swapped entries change the checksum
    inline void mix(uint32_t& checksum, uint32_t value) {
        checksum = checksum * 31u + value;
    }
}

uint32_t compute_checksum(const SimulationResult& result) {
    uint32_t checksum = 0;

    mix(checksum, fold(static_cast<uint64_t>(result.n_injected)));
    mix(checksum, fold(static_cast<uint64_t>(result.n_absorbed)));
    mix(checksum, fold(static_cast<uint64_t>(result.n_truncated)));
    mix(checksum, fold(static_cast<uint64_t>(result.n_errors)));

    for (long long c : result.counts.edges) {
        mix(checksum, fold(static_cast<uint64_t>(c)));
    }
    for (long long c : result.counts.lines) {
        mix(checksum, fold(static_cast<uint64_t>(c)));
    }

    for (const auto& trajectory : result.trajectories) {
        mix(checksum, static_cast<uint32_t>(trajectory.size()));
        for (const auto& wp : trajectory) {
            mix(checksum, static_cast<uint32_t>(wp.n_f.bin));
            mix(checksum, fold_double(wp.n_f.frac));
            mix(checksum, fold_double(wp.pos.x));
            mix(checksum, fold_double(wp.pos.y));
            mix(checksum, static_cast<uint32_t>(wp.state));
            mix(checksum, wp.edge ? static_cast<uint32_t>(*wp.edge) : 0xFFFFFFFFu);
        }
    }

    return checksum;
}

bool verify_determinism(
    const Frame& frame,
    const Bandstructure& band,
    const SimulationParams& params,
    const AuxiliaryLines& lines,
    std::size_t n_inject
) {
    // Run simulation twice with identical inputs
    Simulation first(frame, band, params, lines);
    Simulation second(frame, band, params, lines);
    SimulationResult result1 = first.run_simulation(n_inject);
    SimulationResult result2 = second.run_simulation(n_inject);

    return compute_checksum(result1) == compute_checksum(result2) &&
           result1.counts == result2.counts;
}

} // namespace bmc_2d
