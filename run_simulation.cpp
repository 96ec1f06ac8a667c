#include "analysis/layer_stats.hpp"
#include "audit/absorption_audit.hpp"
#include "core/config_loader.hpp"
#include "core/simulation_adapter.hpp"
#include "io/result_store.hpp"
#include "transport/simulation.hpp"
#include "utils/logger.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace bmc_2d;

/**
 * @brief Insert a suffix before the file extension: counts.txt -> counts_2.txt
 */
std::string with_suffix(const std::string& filename, const std::string& suffix) {
    size_t dot = filename.find_last_of('.');
    size_t slash = filename.find_last_of('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return filename + suffix;
    }
    return filename.substr(0, dot) + suffix + filename.substr(dot);
}

int main(int argc, char* argv[]) {
    std::string config_file = "sim.ini";

    if (argc > 1) {
        config_file = argv[1];
    }

    std::cout << "========================================\n";
    std::cout << "BMC_2D: Ballistic Monte Carlo Transport\n";
    std::cout << "========================================\n";
    std::cout << "Loading configuration from: " << config_file << std::endl;

    try {
        auto config = load_simulation_config(config_file);
        config.validate();
        print_config_summary(std::cout, config);

        auto& log = Logger::get();
        log.set_level(string_to_log_level(config.logging.level));
        log.set_colors(config.logging.colors);

        // Resolve output directory relative to config file location
        std::string output_dir = config.output.output_dir;
        if (!output_dir.empty() && output_dir[0] != '/') {
            size_t last_slash = config_file.find_last_of("/\\");
            if (last_slash != std::string::npos) {
                std::string config_dir = config_file.substr(0, last_slash);
                output_dir = config_dir + "/" + output_dir;
            }
        }

        if (!create_output_directory(output_dir)) {
            log.warn("Could not create output directory: %s", output_dir.c_str());
        }

        const Frame frame = make_frame(config.device);
        const AuxiliaryLines lines = make_aux_lines(config.device);
        const SimulationParams params = make_params(config);
        const StoredStates stored = make_stored_states(config.output);

        std::vector<SimulationResult> results;
        results.reserve(config.transport.fields.size());
        AuxiliaryLines counted_lines;
        bool all_balanced = true;

        std::cout << "\n--- Running Field Sweep ---" << std::endl;

        for (size_t i = 0; i < config.transport.fields.size(); ++i) {
            const double field = config.transport.fields[i];
            log.info("Field %zu/%zu: B = %.6g", i + 1, config.transport.fields.size(), field);

            Simulation sim(frame, make_bandstructure(config.fermi_surface, field), params, lines);
            counted_lines = sim.aux_lines();

            SimulationResult result;
            if (config.output.use_cache) {
                result = run_simulation_with_cache(
                    sim,
                    config.output.identifier + "_" + std::to_string(i),
                    config.transport.n_inject,
                    config.output.cache_dir,
                    stored,
                    config.transport.debug);
            } else {
                result = sim.run_simulation(config.transport.n_inject, stored, config.transport.debug);
            }

            AbsorptionAudit audit = audit_absorption(result, sim.frame(), params.grounded_layer);
            if (!check_absorption_balance(audit)) {
                all_balanced = false;
                print_absorption_report(std::cout, audit);
            }

            const std::string counts_path =
                output_dir + "/" + with_suffix(config.output.counts_file, "_" + std::to_string(i));
            if (save_counts(counts_path, result, sim.frame(), sim.aux_lines())) {
                std::cout << "  Counts saved to: " << counts_path << std::endl;
            }

            if (config.output.save_trajectories) {
                const std::string traj_path =
                    output_dir + "/" + with_suffix(config.output.trajectories_file, "_" + std::to_string(i));
                if (save_trajectories(traj_path, result)) {
                    std::cout << "  Trajectories saved to: " << traj_path << std::endl;
                }
            }

            results.push_back(std::move(result));
        }

        std::cout << "\n--- Saving Layer Statistics ---" << std::endl;

        const LayerStats stats = calc_layer_stats(results, frame, counted_lines);
        const std::string stats_path = output_dir + "/" + config.output.layer_stats_file;
        if (save_layer_stats(stats_path, config.transport.fields, stats)) {
            std::cout << "  Layer statistics saved to: " << stats_path << std::endl;
        }

        if (!all_balanced) {
            log.warn("Absorption audit failed for at least one field");
        }

        std::cout << "\n=== Simulation Complete ===" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
