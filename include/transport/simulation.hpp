#pragma once
#include "band/bandstructure.hpp"
#include "core/types.hpp"
#include "geometry/aux_lines.hpp"
#include "geometry/frame.hpp"
#include "transport/edge_counts.hpp"
#include "transport/trajectory.hpp"
#include <cstddef>
#include <memory>
#include <random>
#include <utility>
#include <vector>

namespace bmc_2d {

struct SimulationParams {
    double p_scatter = 1.0;            // Scatter (vs. reflect) probability at a boundary
    double p_ohmic_absorb = 1.0;       // Absorption probability at a contact
    int grounded_layer = 2;
    int injection_layer = 1;
    unsigned int random_seed = 42;
    std::size_t max_steps = 0;         // Per trajectory, 0 = unbounded
    double intersection_bias = 1e-10;  // Pull-back of crossing points along the step
    double corner_tolerance = 1e-12;   // Relative distance tolerance for corner hits

    // Throws std::invalid_argument on out-of-range values
    void validate() const;
};

// Waypoints produced by one step, in order
struct StepResult {
    std::vector<Waypoint> waypoints;
    std::vector<std::size_t> line_crosses;  // Auxiliary lines crossed by the full step
    bool terminal = false;                  // Grounded absorption or out-of-bounds
};

struct SimulationResult {
    EdgeCounts counts;
    std::vector<Trajectory> trajectories;  // One per injected carrier
    long long n_injected = 0;
    long long n_absorbed = 0;
    long long n_truncated = 0;             // Stopped by max_steps
    long long n_errors = 0;                // Left the device (debug only)
};

/**
 * @brief Monte Carlo driver for ballistic carriers in a 2D device
 *
 * Geometry and band structure are copied at construction, every edge gets
 * the injection distribution for its normal, and auxiliary line layers are
 * shifted past the largest device layer. The snapshots are immutable from
 * then on. All random draws come from one std::mt19937 owned by the
 * instance, so two Simulations built from the same inputs and seed produce
 * identical results.
 */
class Simulation {
public:
    Simulation(
        const Frame& frame,
        const Bandstructure& band,
        const SimulationParams& params = SimulationParams(),
        const AuxiliaryLines& lines = AuxiliaryLines()
    );

    /**
     * @brief Inject n_inject carriers and follow each until it is absorbed
     *        by the grounded contact
     *
     * @param stored States kept in the returned trajectories; counts do not
     *               depend on it
     * @param debug  Check that every step starts inside the device
     * @throws ReflectionError if a specular reflection has no target
     */
    SimulationResult run_simulation(
        std::size_t n_inject,
        const StoredStates& stored = StoredStates::all(),
        bool debug = false
    );

    // Advance one carrier by one step, resolving any boundary hit
    StepResult step_position(const FermiState& n_f, const Vec2& pos, bool debug = false);

    // Free flight along the rest of the current chord
    std::pair<FermiState, Vec2> update_position(const FermiState& n_f, const Vec2& pos) const;

    // INJECTING waypoint on a contact layer, tagged with the injecting edge
    Waypoint inject(int layer);

    void reseed(unsigned int seed) { rng_.seed(seed); }

    const Frame& frame() const { return *frame_; }
    const Bandstructure& bandstructure() const { return *band_; }
    const AuxiliaryLines& aux_lines() const { return *lines_; }
    const SimulationParams& params() const { return params_; }

private:
    struct Hit {
        std::size_t counted;       // Edge that receives the count and decides the branch
        const Edge* edge_0;
        const Edge* edge_1;        // nullptr unless corner
        FermiState n_f;            // Fermi state at the crossing
        Vec2 point;                // Pulled back inside the device
        Vec2 wall_point;           // On the wall; the outgoing state starts here
        Vec2 origin;               // Step start
        bool corner = false;
    };

    FermiState intersection_state(const FermiState& n_f, const Vec2& from, const Vec2& hit, const Vec2& to) const;
    void resolve_hit(const Hit& hit, StepResult& out);
    void scatter_or_reflect(const Hit& hit, StepResult& out);
    bool draw(double p);

    std::shared_ptr<const Frame> frame_;
    std::shared_ptr<const Bandstructure> band_;
    std::shared_ptr<const AuxiliaryLines> lines_;
    SimulationParams params_;
    std::mt19937 rng_;
};

} // namespace bmc_2d
