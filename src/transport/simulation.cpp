#include "transport/simulation.hpp"
#include "transport/contact.hpp"
#include "transport/intersection_engine.hpp"
#include "transport/reflection.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace bmc_2d {

void SimulationParams::validate() const {
    if (!(p_scatter >= 0.0 && p_scatter <= 1.0)) {
        throw std::invalid_argument("p_scatter must be in [0, 1]");
    }
    if (!(p_ohmic_absorb >= 0.0 && p_ohmic_absorb <= 1.0)) {
        throw std::invalid_argument("p_ohmic_absorb must be in [0, 1]");
    }
    if (grounded_layer == kDeviceBoundaryLayer) {
        throw std::invalid_argument("grounded_layer cannot be the device boundary layer");
    }
    if (injection_layer == kDeviceBoundaryLayer) {
        throw std::invalid_argument("injection_layer cannot be the device boundary layer");
    }
    if (!(intersection_bias >= 0.0) || !std::isfinite(intersection_bias)) {
        throw std::invalid_argument("intersection_bias must be finite and non-negative");
    }
    if (!(corner_tolerance >= 0.0) || !std::isfinite(corner_tolerance)) {
        throw std::invalid_argument("corner_tolerance must be finite and non-negative");
    }
}

Simulation::Simulation(
    const Frame& frame,
    const Bandstructure& band,
    const SimulationParams& params,
    const AuxiliaryLines& lines
)
    : params_(params)
    , rng_(params.random_seed)
{
    params_.validate();

    if (!frame.has_layer(params_.injection_layer)) {
        throw std::invalid_argument(
            "Simulation: no edge on injection layer " + std::to_string(params_.injection_layer));
    }

    Frame device = frame;
    for (std::size_t i = 0; i < device.size(); ++i) {
        InjectionProbability prob = band.calculate_injection_prob(device.edge(i).normal_angle());
        device.set_edge_in_prob(i, std::move(prob.in_prob), std::move(prob.cum_prob));
    }

    AuxiliaryLines counting = lines;
    counting.offset_layers(device.max_layer() + 1);

    auto& log = Logger::get();
    if (!device.has_layer(params_.grounded_layer)) {
        log.warn("No edge on grounded layer %d; trajectories end only at max_steps", params_.grounded_layer);
    }
    log.debug("Simulation: %zu edges, %zu auxiliary lines, %d Fermi bins, B = %.6g",
              device.size(), counting.size(), band.n_bins(), band.field());

    frame_ = std::make_shared<const Frame>(std::move(device));
    band_ = std::make_shared<const Bandstructure>(band);
    lines_ = std::make_shared<const AuxiliaryLines>(std::move(counting));
}

bool Simulation::draw(double p) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    return uniform(rng_) < p;
}

Waypoint Simulation::inject(int layer) {
    std::pair<Vec2, std::size_t> entry = frame_->sample_injection(layer, rng_);
    FermiState n_f = frame_->edge(entry.second).sample_injection_index(rng_);
    return Waypoint{n_f, entry.first, TrajectoryState::INJECTING, entry.second};
}

std::pair<FermiState, Vec2> Simulation::update_position(const FermiState& n_f, const Vec2& pos) const {
    const Vec2 next = pos + n_f.frac * band_->dr_at(n_f.bin);
    return {FermiState{(n_f.bin + 1) % band_->n_bins(), 1.0}, next};
}

FermiState Simulation::intersection_state(const FermiState& n_f, const Vec2& from, const Vec2& hit, const Vec2& to) const {
    const double full = (to - from).norm2();
    const double travelled = (hit - from).norm2();
    double frac = n_f.frac * (1.0 - std::sqrt(travelled / full));
    frac = std::max(0.0, frac);
    return FermiState{n_f.bin, frac};
}

StepResult Simulation::step_position(const FermiState& n_f, const Vec2& pos, bool debug) {
    StepResult out;
    if (debug && !frame_->contains(pos, params_.intersection_bias)) {
        Logger::get().error("Previous step left the device: bin %d frac %.6f at (%.9g, %.9g)",
                            n_f.bin, n_f.frac, pos.x, pos.y);
        out.waypoints.push_back(Waypoint{n_f, pos, TrajectoryState::ERROR, std::nullopt});
        out.terminal = true;
        return out;
    }

    const std::pair<FermiState, Vec2> next = update_position(n_f, pos);
    const Vec2& to = next.second;

    out.line_crosses = find_crosses(*lines_, pos, to);

    const std::vector<Edge>& edges = frame_->edges();
    const std::vector<Intersection> hits =
        sorted_intersections(edges, frame_->table(), pos, to, params_.intersection_bias);

    switch (classify_hits(hits, params_.corner_tolerance)) {
        case HitKind::NONE:
            out.waypoints.push_back(Waypoint{next.first, to, TrajectoryState::PROPAGATE, std::nullopt});
            break;

        case HitKind::SINGLE: {
            const Intersection& first = hits[0];
            Hit hit;
            hit.counted = first.edge;
            hit.edge_0 = &edges[first.edge];
            hit.edge_1 = nullptr;
            hit.n_f = intersection_state(n_f, pos, first.point, to);
            hit.point = first.point;
            hit.wall_point = first.crossing;
            hit.origin = pos;
            hit.corner = false;
            resolve_hit(hit, out);
            break;
        }

        case HitKind::CORNER: {
            const Intersection& first = hits[0];
            const Intersection& second = hits[1];
            Hit hit;
            hit.counted = counted_corner_edge(edges, first, second);
            hit.edge_0 = &edges[first.edge];
            hit.edge_1 = &edges[second.edge];
            hit.n_f = intersection_state(n_f, pos, first.point, to);
            hit.point = first.point;
            hit.wall_point = first.crossing;
            hit.origin = pos;
            hit.corner = true;
            resolve_hit(hit, out);
            break;
        }
    }
    return out;
}

void Simulation::resolve_hit(const Hit& hit, StepResult& out) {
    const Edge& counted = frame_->edge(hit.counted);
    const ContactClass contact = classify_layer(counted.layer(), params_.grounded_layer);
    const TrajectoryState collision = hit.corner ? TrajectoryState::CCOLLISION : TrajectoryState::COLLISION;
    const TrajectoryState absorbed = hit.corner ? TrajectoryState::CABSORBED : TrajectoryState::ABSORBED;

    switch (contact.kind) {
        case ContactKind::DEVICE_BOUNDARY:
            out.waypoints.push_back(Waypoint{hit.n_f, hit.point, collision, hit.counted});
            scatter_or_reflect(hit, out);
            break;

        case ContactKind::GROUNDED:
            if (draw(params_.p_ohmic_absorb)) {
                out.waypoints.push_back(Waypoint{hit.n_f, hit.point, absorbed, hit.counted});
                out.terminal = true;
            } else {
                out.waypoints.push_back(Waypoint{hit.n_f, hit.point, collision, std::nullopt});
                scatter_or_reflect(hit, out);
            }
            break;

        case ContactKind::FLOATING:
            if (draw(params_.p_ohmic_absorb)) {
                out.waypoints.push_back(Waypoint{hit.n_f, hit.point, absorbed, hit.counted});
                Waypoint reentry = inject(contact.layer);
                reentry.edge.reset();
                out.waypoints.push_back(reentry);
            } else {
                out.waypoints.push_back(Waypoint{hit.n_f, hit.point, collision, std::nullopt});
                scatter_or_reflect(hit, out);
            }
            break;
    }
}

void Simulation::scatter_or_reflect(const Hit& hit, StepResult& out) {
    const Edge& counted = frame_->edge(hit.counted);
    FermiState n_f_new;
    TrajectoryState state = TrajectoryState::PROPAGATE;

    if (draw(params_.p_scatter)) {
        if (hit.corner) {
            n_f_new = corner_scatter(*hit.edge_0, *hit.edge_1, counted, rng_);
            state = TrajectoryState::CSCATTER;
        } else {
            n_f_new = scatter(counted, rng_);
            state = TrajectoryState::SCATTER;
        }
    } else {
        if (hit.corner) {
            n_f_new = corner_specular(*band_, hit.n_f, *hit.edge_0, *hit.edge_1, counted, hit.origin);
            state = TrajectoryState::CREFLECT;
        } else {
            n_f_new = specular(*band_, hit.n_f, counted);
            state = TrajectoryState::REFLECT;
        }
    }
    out.waypoints.push_back(Waypoint{n_f_new, hit.wall_point, state, std::nullopt});
}

SimulationResult Simulation::run_simulation(std::size_t n_inject, const StoredStates& stored, bool debug) {
    auto& log = Logger::get();
    SimulationResult result;
    result.counts = EdgeCounts(frame_->size(), lines_->size());
    result.trajectories.reserve(n_inject);

    log.info("Injecting %zu carriers (B = %.6g, p_scatter = %.3f, p_ohmic_absorb = %.3f)",
             n_inject, band_->field(), params_.p_scatter, params_.p_ohmic_absorb);

    try {
        for (std::size_t n = 0; n < n_inject; ++n) {
            Trajectory trajectory;
            const Waypoint start = inject(params_.injection_layer);
            if (stored.contains(start.state)) {
                trajectory.push_back(start);
            }

            FermiState n_f = start.n_f;
            Vec2 pos = start.pos;
            std::size_t steps = 0;
            bool done = false;

            while (!done) {
                if (params_.max_steps > 0 && steps >= params_.max_steps) {
                    log.debug("Trajectory %zu truncated after %zu steps", n, steps);
                    ++result.n_truncated;
                    break;
                }

                StepResult step = step_position(n_f, pos, debug);
                ++steps;

                for (const auto& wp : step.waypoints) {
                    if (wp.edge) {
                        ++result.counts.edges[*wp.edge];
                    }
                    if (stored.contains(wp.state)) {
                        trajectory.push_back(wp);
                    }
                }
                for (std::size_t line : step.line_crosses) {
                    ++result.counts.lines[line];
                }

                const Waypoint& last = step.waypoints.back();
                if (step.terminal) {
                    done = true;
                    if (last.state == TrajectoryState::ERROR) {
                        ++result.n_errors;
                    } else {
                        ++result.n_absorbed;
                    }
                }
                n_f = last.n_f;
                pos = last.pos;
            }

            result.trajectories.push_back(std::move(trajectory));
            ++result.n_injected;
        }
    } catch (const ReflectionError& e) {
        log.error("Simulation aborted after %lld carriers: %s", result.n_injected, e.what());
        throw;
    }

    if (result.n_truncated > 0) {
        log.warn("%lld of %lld trajectories reached max_steps = %zu",
                 result.n_truncated, result.n_injected, params_.max_steps);
    }
    if (result.n_errors > 0) {
        log.warn("%lld trajectories left the device", result.n_errors);
    }
    log.info("Done: %lld absorbed, %lld edge counts, %lld line crossings",
             result.n_absorbed, result.counts.total_edges(), result.counts.total_lines());
    return result;
}

} // namespace bmc_2d
