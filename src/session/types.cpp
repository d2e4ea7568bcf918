#include "gesu/session/types.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace gesu::session {

const char* to_string(Mode mode) noexcept {
    switch (mode) {
        case Mode::Mirror: return "mirror";
        case Mode::Camera: return "camera";
    }
    return "unknown";
}

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Starting:   return "starting";
        case SessionState::Running:    return "running";
        case SessionState::Stopping:   return "stopping";
        case SessionState::Terminated: return "terminated";
        case SessionState::Crashed:    return "crashed";
    }
    return "unknown";
}

std::optional<Mode> parse_mode(std::string_view text) {
    if (text == "mirror") {
        return Mode::Mirror;
    }
    if (text == "camera") {
        return Mode::Camera;
    }
    return std::nullopt;
}

bool can_transition(SessionState from, SessionState to) noexcept {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::Starting, {SessionState::Running, SessionState::Terminated}},
        {SessionState::Running, {SessionState::Stopping, SessionState::Crashed}},
        {SessionState::Stopping, {SessionState::Terminated}},
    };

    const auto it = transitions.find(from);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), to) != allowed.end();
}

} // namespace gesu::session
