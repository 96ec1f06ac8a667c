#pragma once
#include "core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace bmc_2d {

/**
 * @brief Tag of a recorded waypoint
 *
 * The C-prefixed states are the corner variants, produced when a step hits
 * two edges at their shared vertex.
 */
enum class TrajectoryState : int {
    INJECTING = 1,
    PROPAGATE = 2,
    COLLISION = 3,
    SCATTER = 4,
    REFLECT = 5,
    ABSORBED = 6,
    CCOLLISION = 7,
    CSCATTER = 8,
    CREFLECT = 9,
    CABSORBED = 10,
    ERROR = 11
};

constexpr int kNumTrajectoryStates = 11;

const char* trajectory_state_to_string(TrajectoryState state);
TrajectoryState string_to_trajectory_state(const std::string& str);

inline bool is_absorption(TrajectoryState s) {
    return s == TrajectoryState::ABSORBED || s == TrajectoryState::CABSORBED;
}

inline bool is_corner_state(TrajectoryState s) {
    return s == TrajectoryState::CCOLLISION || s == TrajectoryState::CSCATTER ||
           s == TrajectoryState::CREFLECT || s == TrajectoryState::CABSORBED;
}

struct Waypoint {
    FermiState n_f;
    Vec2 pos;
    TrajectoryState state = TrajectoryState::PROPAGATE;
    std::optional<std::size_t> edge;  // Counted device edge, if any
};

using Trajectory = std::vector<Waypoint>;

/**
 * @brief Set of states kept in recorded trajectories
 */
class StoredStates {
public:
    StoredStates() = default;
    StoredStates(std::initializer_list<TrajectoryState> states);

    static StoredStates all();
    static StoredStates none() { return StoredStates(); }

    // Comma separated state names, or "all" / "none"
    static StoredStates parse(const std::string& names);
    std::string to_string() const;

    void insert(TrajectoryState s) { mask_ |= bit(s); }
    void erase(TrajectoryState s) { mask_ &= ~bit(s); }
    bool contains(TrajectoryState s) const { return (mask_ & bit(s)) != 0; }
    bool is_all() const { return mask_ == all().mask_; }
    bool empty() const { return mask_ == 0; }

private:
    static std::uint32_t bit(TrajectoryState s) { return 1u << static_cast<int>(s); }
    std::uint32_t mask_ = 0;
};

} // namespace bmc_2d
