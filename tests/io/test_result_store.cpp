#include <gtest/gtest.h>
#include "io/result_store.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using namespace bmc_2d;

namespace {
    Simulation make_simulation(unsigned int seed) {
        SimulationParams params;
        params.random_seed = seed;
        Frame frame = Frame::rectangle(1.0, 1.0, {1, 0, 2, 0});
        Bandstructure band(Bandstructure::circular_fermi_surface(60, 0.5), 0.0, 1.0);
        AuxiliaryLines lines = AuxiliaryLines::from_segments({{{0.0, 0.5}, {1.0, 0.5}}});
        return Simulation(frame, band, params, lines);
    }

    void expect_same_result(const SimulationResult& a, const SimulationResult& b) {
        EXPECT_EQ(a.n_injected, b.n_injected);
        EXPECT_EQ(a.n_absorbed, b.n_absorbed);
        EXPECT_EQ(a.n_truncated, b.n_truncated);
        EXPECT_EQ(a.n_errors, b.n_errors);
        EXPECT_EQ(a.counts, b.counts);
        ASSERT_EQ(a.trajectories.size(), b.trajectories.size());
        for (size_t t = 0; t < a.trajectories.size(); ++t) {
            ASSERT_EQ(a.trajectories[t].size(), b.trajectories[t].size());
            for (size_t w = 0; w < a.trajectories[t].size(); ++w) {
                const Waypoint& x = a.trajectories[t][w];
                const Waypoint& y = b.trajectories[t][w];
                EXPECT_EQ(x.n_f, y.n_f);
                EXPECT_EQ(x.pos, y.pos);
                EXPECT_EQ(x.state, y.state);
                EXPECT_EQ(x.edge, y.edge);
            }
        }
    }

    int count_data_rows(const fs::path& path) {
        std::ifstream in(path);
        std::string line;
        int rows = 0;
        while (std::getline(in, line)) {
            if (!line.empty() && line[0] != '#') ++rows;
        }
        return rows;
    }
}

TEST(ResultStoreTest, StreamRoundTripIsExact) {
    Simulation sim = make_simulation(42);
    SimulationResult result = sim.run_simulation(30);

    std::stringstream buffer;
    write_result(buffer, result);
    SimulationResult loaded = read_result(buffer);
    expect_same_result(result, loaded);
}

TEST(ResultStoreTest, RejectsForeignOrCorruptStreams) {
    std::istringstream foreign("SOMETHING_ELSE 1\n");
    EXPECT_THROW(read_result(foreign), std::runtime_error);

    std::istringstream future("BMC_RESULT 99\n");
    EXPECT_THROW(read_result(future), std::runtime_error);

    std::istringstream truncated("BMC_RESULT 1\nsummary 3 3 0 0\nedges 4 1 2\n");
    EXPECT_THROW(read_result(truncated), std::runtime_error);

    std::istringstream bad_state(
        "BMC_RESULT 1\nsummary 1 1 0 0\nedges 1 1\nlines 0\n"
        "trajectories 1\ntrajectory 1\n0 1 0.5 0.5 42 -1\n");
    EXPECT_THROW(read_result(bad_state), std::runtime_error);

    EXPECT_THROW(load_result("/nonexistent/result.bmc"), std::runtime_error);
}

TEST(ResultStoreTest, CachePath) {
    EXPECT_EQ(cache_path("cache", "run_0"), "cache/run_0.bmc");
    EXPECT_EQ(cache_path("cache/", "run_0"), "cache/run_0.bmc");
    EXPECT_EQ(cache_path("", "run_0"), "run_0.bmc");
}

TEST(ResultStoreTest, CacheSkipsSecondRun) {
    const fs::path dir = fs::temp_directory_path() / "bmc2d_cache_test";
    fs::remove_all(dir);

    Simulation first_sim = make_simulation(1);
    SimulationResult first = run_simulation_with_cache(first_sim, "square", 20, dir.string());
    EXPECT_TRUE(file_exists(cache_path(dir.string(), "square")));

    // A different seed would give a different result; the cache wins
    Simulation second_sim = make_simulation(2);
    SimulationResult second = run_simulation_with_cache(second_sim, "square", 20, dir.string());
    expect_same_result(first, second);

    fs::remove_all(dir);
}

TEST(ResultStoreTest, SaveCountsWritesOneRowPerEdgeAndLine) {
    Simulation sim = make_simulation(42);
    SimulationResult result = sim.run_simulation(20);

    const fs::path path = fs::temp_directory_path() / "bmc2d_counts_test.txt";
    ASSERT_TRUE(save_counts(path.string(), result, sim.frame(), sim.aux_lines()));
    EXPECT_EQ(count_data_rows(path), 5);
    fs::remove(path);

    SimulationResult mismatched = result;
    mismatched.counts.edges.pop_back();
    EXPECT_FALSE(save_counts(path.string(), mismatched, sim.frame(), sim.aux_lines()));
    EXPECT_FALSE(file_exists(path.string()));
}

TEST(ResultStoreTest, SaveTrajectories) {
    Simulation sim = make_simulation(42);
    SimulationResult result = sim.run_simulation(5);

    size_t waypoints = 0;
    for (const auto& trajectory : result.trajectories) {
        waypoints += trajectory.size();
    }

    const fs::path path = fs::temp_directory_path() / "bmc2d_trajectories_test.txt";
    ASSERT_TRUE(save_trajectories(path.string(), result));
    EXPECT_EQ(static_cast<size_t>(count_data_rows(path)), waypoints);
    fs::remove(path);
}

TEST(ResultStoreTest, CreateOutputDirectory) {
    const fs::path dir = fs::temp_directory_path() / "bmc2d_output_dir_test";
    fs::remove_all(dir);
    EXPECT_TRUE(create_output_directory(dir.string()));
    EXPECT_TRUE(create_output_directory(dir.string()));
    EXPECT_FALSE(file_exists(dir.string()));
    fs::remove_all(dir);
}
