#include "transport/trajectory.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace bmc_2d {

namespace {
    std::string trim_token(const std::string& str) {
        size_t start = 0;
        while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
            ++start;
        }
        size_t end = str.length();
        while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
            --end;
        }
        return str.substr(start, end - start);
    }
}

const char* trajectory_state_to_string(TrajectoryState state) {
    switch (state) {
        case TrajectoryState::INJECTING:  return "injecting";
        case TrajectoryState::PROPAGATE:  return "propagate";
        case TrajectoryState::COLLISION:  return "collision";
        case TrajectoryState::SCATTER:    return "scatter";
        case TrajectoryState::REFLECT:    return "reflect";
        case TrajectoryState::ABSORBED:   return "absorbed";
        case TrajectoryState::CCOLLISION: return "ccollision";
        case TrajectoryState::CSCATTER:   return "cscatter";
        case TrajectoryState::CREFLECT:   return "creflect";
        case TrajectoryState::CABSORBED:  return "cabsorbed";
        case TrajectoryState::ERROR:      return "error";
    }
    return "unknown";
}

TrajectoryState string_to_trajectory_state(const std::string& str) {
    std::string val = trim_token(str);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (int i = 1; i <= kNumTrajectoryStates; ++i) {
        TrajectoryState s = static_cast<TrajectoryState>(i);
        if (val == trajectory_state_to_string(s)) {
            return s;
        }
    }
    throw std::invalid_argument("Unknown trajectory state: " + str);
}

StoredStates::StoredStates(std::initializer_list<TrajectoryState> states) {
    for (TrajectoryState s : states) {
        insert(s);
    }
}

StoredStates StoredStates::all() {
    StoredStates out;
    for (int i = 1; i <= kNumTrajectoryStates; ++i) {
        out.insert(static_cast<TrajectoryState>(i));
    }
    return out;
}

StoredStates StoredStates::parse(const std::string& names) {
    std::string trimmed = trim_token(names);
    if (trimmed.empty() || trimmed == "all") {
        return all();
    }
    if (trimmed == "none") {
        return none();
    }

    StoredStates out;
    std::stringstream ss(trimmed);
    std::string token;
    while (std::getline(ss, token, ',')) {
        if (trim_token(token).empty()) {
            continue;
        }
        out.insert(string_to_trajectory_state(token));
    }
    return out;
}

std::string StoredStates::to_string() const {
    if (is_all()) return "all";
    if (empty()) return "none";

    std::ostringstream oss;
    bool first = true;
    for (int i = 1; i <= kNumTrajectoryStates; ++i) {
        TrajectoryState s = static_cast<TrajectoryState>(i);
        if (contains(s)) {
            if (!first) oss << ",";
            oss << trajectory_state_to_string(s);
            first = false;
        }
    }
    return oss.str();
}

} // namespace bmc_2d
