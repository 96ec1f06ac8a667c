#include "analysis/layer_stats.hpp"
#include "utils/logger.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace bmc_2d {

LayerCounts layer_counts(const SimulationResult& result, const Frame& frame, const AuxiliaryLines& lines) {
    if (result.counts.edges.size() != frame.size() || result.counts.lines.size() != lines.size()) {
        throw std::invalid_argument("layer_counts: counts do not match the device geometry");
    }

    LayerCounts out;
    for (std::size_t i = 0; i < frame.size(); ++i) {
        out[frame.edge(i).layer()] += result.counts.edges[i];
    }
    for (std::size_t i = 0; i < lines.size(); ++i) {
        out[lines.line(i).layer()] += result.counts.lines[i];
    }
    return out;
}

LayerStats calc_layer_stats(const std::vector<SimulationResult>& results, const Frame& frame, const AuxiliaryLines& lines) {
    LayerStats stats;
    for (std::size_t run = 0; run < results.size(); ++run) {
        const LayerCounts counts = layer_counts(results[run], frame, lines);
        for (const auto& entry : counts) {
            auto it = stats.find(entry.first);
            if (it == stats.end()) {
                it = stats.emplace(entry.first, std::vector<double>(results.size(), 0.0)).first;
            }
            it->second[run] += static_cast<double>(entry.second);
        }
    }
    return stats;
}

bool save_layer_stats(const std::string& path, const std::vector<double>& fields, const LayerStats& stats) {
    for (const auto& entry : stats) {
        if (entry.second.size() != fields.size()) {
            Logger::get().error("Layer %d has %zu runs, expected %zu", entry.first,
                                entry.second.size(), fields.size());
            return false;
        }
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        Logger::get().error("Cannot open %s for writing", path.c_str());
        return false;
    }

    out << "# Per-layer counts\n";
    out << "# field";
    for (const auto& entry : stats) {
        out << "\tlayer_" << entry.first;
    }
    out << "\n";

    out << std::setprecision(10);
    for (std::size_t run = 0; run < fields.size(); ++run) {
        out << fields[run];
        for (const auto& entry : stats) {
            out << "\t" << entry.second[run];
        }
        out << "\n";
    }
    return true;
}

} // namespace bmc_2d
