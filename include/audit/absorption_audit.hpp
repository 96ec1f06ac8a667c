#pragma once
#include "geometry/frame.hpp"
#include "transport/simulation.hpp"
#include <iosfwd>

namespace bmc_2d {

struct AbsorptionAudit {
    long long n_injected = 0;
    long long n_absorbed = 0;
    long long n_truncated = 0;
    long long n_errors = 0;
    long long grounded_count = 0;   // Counts on grounded edges
    long long balance_error = 0;    // n_injected - (absorbed + truncated + errors)
    long long grounded_error = 0;   // grounded_count - n_absorbed
};

AbsorptionAudit audit_absorption(const SimulationResult& result, const Frame& frame, int grounded_layer);

// Every carrier ends exactly once, and only grounded absorptions are counted on grounded edges
bool check_absorption_balance(AbsorptionAudit& audit);

void print_absorption_report(std::ostream& os, const AbsorptionAudit& audit);

} // namespace bmc_2d
