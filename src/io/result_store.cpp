#include "io/result_store.hpp"
#include "utils/logger.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/types.h>

namespace bmc_2d {

namespace {
    const char* kMagic = "BMC_RESULT";

    void expect_token(std::istream& in, const std::string& expected) {
        std::string token;
        if (!(in >> token) || token != expected) {
            throw std::runtime_error("Result file: expected '" + expected + "', found '" + token + "'");
        }
    }

    template <typename T>
    T read_value(std::istream& in, const char* what) {
        T value{};
        if (!(in >> value)) {
            throw std::runtime_error(std::string("Result file: cannot read ") + what);
        }
        return value;
    }

    std::vector<long long> read_counts(std::istream& in, const char* tag) {
        expect_token(in, tag);
        const std::size_t n = read_value<std::size_t>(in, tag);
        std::vector<long long> counts(n, 0);
        for (std::size_t i = 0; i < n; ++i) {
            counts[i] = read_value<long long>(in, tag);
        }
        return counts;
    }
}

bool create_output_directory(const std::string& path) {
    struct stat info;
    if (stat(path.c_str(), &info) == 0) {
        return (info.st_mode & S_IFDIR) != 0;
    }
    return mkdir(path.c_str(), 0755) == 0;
}

bool file_exists(const std::string& path) {
    struct stat info;
    return stat(path.c_str(), &info) == 0 && (info.st_mode & S_IFREG) != 0;
}

void write_result(std::ostream& out, const SimulationResult& result) {
    out << std::setprecision(17);
    out << kMagic << " " << kResultFormatVersion << "\n";
    out << "summary " << result.n_injected << " " << result.n_absorbed << " "
        << result.n_truncated << " " << result.n_errors << "\n";

    out << "edges " << result.counts.edges.size();
    for (long long c : result.counts.edges) {
        out << " " << c;
    }
    out << "\n";

    out << "lines " << result.counts.lines.size();
    for (long long c : result.counts.lines) {
        out << " " << c;
    }
    out << "\n";

    out << "trajectories " << result.trajectories.size() << "\n";
    for (const auto& trajectory : result.trajectories) {
        out << "trajectory " << trajectory.size() << "\n";
        for (const auto& wp : trajectory) {
            out << wp.n_f.bin << " " << wp.n_f.frac << " " << wp.pos.x << " " << wp.pos.y << " "
                << static_cast<int>(wp.state) << " "
                << (wp.edge ? static_cast<long long>(*wp.edge) : -1LL) << "\n";
        }
    }
}

SimulationResult read_result(std::istream& in) {
    expect_token(in, kMagic);
    const int version = read_value<int>(in, "format version");
    if (version != kResultFormatVersion) {
        throw std::runtime_error("Result file: unsupported format version " + std::to_string(version));
    }

    SimulationResult result;
    expect_token(in, "summary");
    result.n_injected = read_value<long long>(in, "n_injected");
    result.n_absorbed = read_value<long long>(in, "n_absorbed");
    result.n_truncated = read_value<long long>(in, "n_truncated");
    result.n_errors = read_value<long long>(in, "n_errors");

    result.counts.edges = read_counts(in, "edges");
    result.counts.lines = read_counts(in, "lines");

    expect_token(in, "trajectories");
    const std::size_t n_traj = read_value<std::size_t>(in, "trajectory count");
    result.trajectories.reserve(n_traj);
    for (std::size_t t = 0; t < n_traj; ++t) {
        expect_token(in, "trajectory");
        const std::size_t n_wp = read_value<std::size_t>(in, "waypoint count");
        Trajectory trajectory;
        trajectory.reserve(n_wp);
        for (std::size_t w = 0; w < n_wp; ++w) {
            Waypoint wp;
            wp.n_f.bin = read_value<int>(in, "bin");
            wp.n_f.frac = read_value<double>(in, "frac");
            wp.pos.x = read_value<double>(in, "x");
            wp.pos.y = read_value<double>(in, "y");
            const int state = read_value<int>(in, "state");
            if (state < 1 || state > kNumTrajectoryStates) {
                throw std::runtime_error("Result file: invalid state " + std::to_string(state));
            }
            wp.state = static_cast<TrajectoryState>(state);
            const long long edge = read_value<long long>(in, "edge");
            if (edge >= 0) {
                wp.edge = static_cast<std::size_t>(edge);
            }
            trajectory.push_back(wp);
        }
        result.trajectories.push_back(std::move(trajectory));
    }
    return result;
}

bool save_result(const std::string& path, const SimulationResult& result) {
    std::ofstream out(path);
    if (!out.is_open()) {
        Logger::get().error("Cannot open %s for writing", path.c_str());
        return false;
    }
    write_result(out, result);
    return static_cast<bool>(out);
}

SimulationResult load_result(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open result file: " + path);
    }
    return read_result(in);
}

std::string cache_path(const std::string& dir, const std::string& identifier) {
    if (dir.empty()) {
        return identifier + ".bmc";
    }
    if (dir.back() == '/') {
        return dir + identifier + ".bmc";
    }
    return dir + "/" + identifier + ".bmc";
}

SimulationResult run_simulation_with_cache(
    Simulation& sim,
    const std::string& identifier,
    std::size_t n_inject,
    const std::string& dir,
    const StoredStates& stored,
    bool debug
) {
    auto& log = Logger::get();
    const std::string path = cache_path(dir, identifier);

    if (file_exists(path)) {
        log.info("Cache %s exists, loading result", path.c_str());
        return load_result(path);
    }

    log.info("Cache %s not found, running simulation", path.c_str());
    SimulationResult result = sim.run_simulation(n_inject, stored, debug);

    if (!dir.empty() && !create_output_directory(dir)) {
        log.warn("Cannot create cache directory %s, result not cached", dir.c_str());
        return result;
    }
    if (!save_result(path, result)) {
        log.warn("Failed to write cache %s", path.c_str());
    }
    return result;
}

bool save_counts(const std::string& path, const SimulationResult& result,
                 const Frame& frame, const AuxiliaryLines& lines) {
    if (result.counts.edges.size() != frame.size() || result.counts.lines.size() != lines.size()) {
        Logger::get().error("Counts do not match the device (%zu/%zu edges, %zu/%zu lines)",
                            result.counts.edges.size(), frame.size(),
                            result.counts.lines.size(), lines.size());
        return false;
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        Logger::get().error("Cannot open %s for writing", path.c_str());
        return false;
    }

    out << "# Edge and auxiliary line counts\n";
    out << "# injected=" << result.n_injected << " absorbed=" << result.n_absorbed
        << " truncated=" << result.n_truncated << " errors=" << result.n_errors << "\n";
    out << "# kind\tindex\tlayer\tx0\ty0\tx1\ty1\tcount\n";
    out << std::setprecision(6);

    for (std::size_t i = 0; i < frame.size(); ++i) {
        const Edge& e = frame.edge(i);
        out << "edge\t" << i << "\t" << e.layer() << "\t"
            << e.p0().x << "\t" << e.p0().y << "\t" << e.p1().x << "\t" << e.p1().y << "\t"
            << result.counts.edges[i] << "\n";
    }
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const Edge& l = lines.line(i);
        out << "line\t" << i << "\t" << l.layer() << "\t"
            << l.p0().x << "\t" << l.p0().y << "\t" << l.p1().x << "\t" << l.p1().y << "\t"
            << result.counts.lines[i] << "\n";
    }
    return true;
}

bool save_trajectories(const std::string& path, const SimulationResult& result) {
    std::ofstream out(path);
    if (!out.is_open()) {
        Logger::get().error("Cannot open %s for writing", path.c_str());
        return false;
    }

    out << "# Stored trajectories\n";
    out << "# trajectory\tbin\tfrac\tx\ty\tstate\tedge\n";
    out << std::setprecision(9);
    for (std::size_t t = 0; t < result.trajectories.size(); ++t) {
        for (const auto& wp : result.trajectories[t]) {
            out << t << "\t" << wp.n_f.bin << "\t" << wp.n_f.frac << "\t"
                << wp.pos.x << "\t" << wp.pos.y << "\t"
                << trajectory_state_to_string(wp.state) << "\t";
            if (wp.edge) {
                out << *wp.edge;
            } else {
                out << "-";
            }
            out << "\n";
        }
        out << "\n";
    }
    return true;
}

} // namespace bmc_2d
