#include "audit/absorption_audit.hpp"
#include <ostream>
#include <stdexcept>

namespace bmc_2d {

AbsorptionAudit audit_absorption(const SimulationResult& result, const Frame& frame, int grounded_layer) {
    if (result.counts.edges.size() != frame.size()) {
        throw std::invalid_argument("audit_absorption: counts do not match the device geometry");
    }

    AbsorptionAudit audit;
    audit.n_injected = result.n_injected;
    audit.n_absorbed = result.n_absorbed;
    audit.n_truncated = result.n_truncated;
    audit.n_errors = result.n_errors;
    for (std::size_t i = 0; i < frame.size(); ++i) {
        if (frame.edge(i).layer() == grounded_layer) {
            audit.grounded_count += result.counts.edges[i];
        }
    }
    return audit;
}

bool check_absorption_balance(AbsorptionAudit& audit) {
    audit.balance_error = audit.n_injected - (audit.n_absorbed + audit.n_truncated + audit.n_errors);
    audit.grounded_error = audit.grounded_count - audit.n_absorbed;
    return audit.balance_error == 0 && audit.grounded_error == 0;
}

void print_absorption_report(std::ostream& os, const AbsorptionAudit& audit) {
    os << "=== Absorption Audit ===\n";
    os << "Injected:  " << audit.n_injected << "\n";
    os << "Absorbed:  " << audit.n_absorbed << "\n";
    os << "Truncated: " << audit.n_truncated << "\n";
    os << "Errors:    " << audit.n_errors << "\n";
    os << "Grounded edge count: " << audit.grounded_count << "\n";
    os << "Balance error: " << audit.balance_error
       << ", grounded error: " << audit.grounded_error << "\n";
    os << "Status: " << (audit.balance_error == 0 && audit.grounded_error == 0 ? "PASS" : "FAIL") << "\n";
}

} // namespace bmc_2d
