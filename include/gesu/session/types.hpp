#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace gesu::session {

enum class Mode {
    Mirror,
    Camera
};

/**
 * STATE TRANSITIONS:
 * Starting → Running → Stopping → Terminated
 * Running → Crashed (process exited without a stop request)
 *
 * Terminated and Crashed are only ever seen on ended-session snapshots;
 * the registry removes the entry in the same critical section.
 */
enum class SessionState {
    Starting,
    Running,
    Stopping,
    Terminated,
    Crashed
};

const char* to_string(Mode mode) noexcept;
const char* to_string(SessionState state) noexcept;
std::optional<Mode> parse_mode(std::string_view text);

bool can_transition(SessionState from, SessionState to) noexcept;

struct SessionKey {
    std::string device_id;
    Mode mode = Mode::Mirror;

    bool operator==(const SessionKey& other) const {
        return mode == other.mode && device_id == other.device_id;
    }
};

struct SessionKeyHash {
    std::size_t operator()(const SessionKey& key) const noexcept {
        return std::hash<std::string>{}(key.device_id) ^ (static_cast<std::size_t>(key.mode) << 1);
    }
};

/**
 * @brief Tool options for a mirroring session
 *
 * Mirror mode only looks at turn_screen_off; the camera fields apply to
 * Mode::Camera.
 */
struct SessionOptions {
    bool turn_screen_off = false;
    std::string camera_facing = "back";     ///< "front" or "back"
    std::string camera_size;                ///< e.g. "1920x1080", empty = tool default
    bool no_audio = false;
    std::string orientation = "landscape";  ///< "portrait" or "landscape"
};

/**
 * @brief Point-in-time view of a session handed to callers
 */
struct Session {
    std::uint64_t session_id = 0;
    std::string device_id;
    Mode mode = Mode::Mirror;
    int pid = -1;
    std::chrono::system_clock::time_point started_at{};
    SessionState state = SessionState::Starting;
    SessionOptions options;
    std::optional<int> exit_code;                              ///< Set once the process ended
    std::optional<std::chrono::system_clock::time_point> ended_at;

    [[nodiscard]] SessionKey key() const { return SessionKey{device_id, mode}; }
};

} // namespace gesu::session
