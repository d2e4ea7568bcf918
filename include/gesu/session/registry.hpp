#pragma once

#include "gesu/core/result.hpp"
#include "gesu/device/device.hpp"
#include "gesu/events/event_bus.hpp"
#include "gesu/process/process.hpp"
#include "gesu/session/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gesu::session {

struct RegistryOptions {
    std::string scrcpy_path = "scrcpy";
    std::chrono::milliseconds terminate_grace{3000};
    std::size_t ended_capacity = 16;
};

/**
 * @brief Owns every live mirroring session, at most one per (device, mode)
 *
 * LOCKING:
 * - A per-key mutex serialises start(), stop() and mark_crashed() on the
 *   same key, so a key never has two states and is never double-spawned
 * - map_mutex_ only guards the container; it is never held while spawning
 *   or terminating a process
 * - Events are emitted with no registry lock held
 */
class SessionRegistry {
public:
    SessionRegistry(process::ProcessRunner& runner,
                    device::DeviceProbe& devices,
                    events::EventBus& bus,
                    RegistryOptions options = {});
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Spawn the mirroring tool for (device, mode)
     *
     * ERRORS:
     * DeviceUnready, DuplicateSession (existing session untouched),
     * Spawn (entry removed again)
     */
    Result<Session> start(const std::string& device_id, Mode mode, const SessionOptions& options = {});

    /**
     * @brief Terminate the session for (device, mode) and remove it
     *
     * When @p expected_session_id is given, only that session is stopped;
     * a session started later for the same key is reported as not found.
     */
    Result<void> stop(const std::string& device_id, Mode mode,
                      std::optional<std::uint64_t> expected_session_id = std::nullopt);

    /// Stops every live session; returns how many were stopped
    std::size_t stop_all();

    [[nodiscard]] std::vector<Session> list(Mode mode) const;
    [[nodiscard]] std::vector<Session> list_all() const;

    /// Most recent ended snapshot for the key (state Terminated or Crashed)
    [[nodiscard]] std::optional<Session> last_known(const std::string& device_id, Mode mode) const;

    // ── Monitor entry points ────────────────────────────────

    struct RunningHandle {
        SessionKey key;
        std::uint64_t session_id = 0;
        std::shared_ptr<process::Process> process;
    };

    /// Handles of Running sessions, for liveness polling outside any lock
    [[nodiscard]] std::vector<RunningHandle> running_handles() const;

    /**
     * @brief Record an unexpected exit
     *
     * No-op (returns false) unless @p session_id is still the Running
     * session for @p key.
     */
    bool mark_crashed(const SessionKey& key, std::uint64_t session_id);

private:
    struct Entry {
        Session info;
        std::shared_ptr<process::Process> process;
    };

    std::shared_ptr<std::mutex> key_mutex(const SessionKey& key);
    void remember_ended_locked(Session snapshot);

    process::ProcessRunner& runner_;
    device::DeviceProbe& devices_;
    events::EventBus& event_bus_;
    RegistryOptions options_;

    std::atomic<std::uint64_t> session_counter_{0};

    mutable std::mutex map_mutex_;
    std::unordered_map<SessionKey, std::shared_ptr<Entry>, SessionKeyHash> sessions_;
    std::unordered_map<SessionKey, std::shared_ptr<std::mutex>, SessionKeyHash> key_mutexes_;
    std::deque<Session> ended_;  ///< Newest first
};

} // namespace gesu::session
