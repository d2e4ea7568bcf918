#include "gesu/session/registry.hpp"
#include "gesu/events/events.hpp"
#include "gesu/session/scrcpy_command.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace gesu::session {
namespace {

std::string describe_key(const SessionKey& key) {
    return key.device_id + "/" + to_string(key.mode);
}

Result<void> transition(Session& info, SessionState next) {
    if (!can_transition(info.state, next)) {
        return Err<void>(ErrorKind::InvalidArgument,
                         std::string("Illegal session transition ") + to_string(info.state) +
                         " -> " + to_string(next));
    }
    info.state = next;
    return Ok();
}

void sort_by_device(std::vector<Session>& sessions) {
    std::sort(sessions.begin(), sessions.end(), [](const Session& a, const Session& b) {
        if (a.device_id != b.device_id) {
            return a.device_id < b.device_id;
        }
        return a.mode < b.mode;
    });
}

} // namespace

SessionRegistry::SessionRegistry(process::ProcessRunner& runner,
                                 device::DeviceProbe& devices,
                                 events::EventBus& bus,
                                 RegistryOptions options)
    : runner_(runner),
      devices_(devices),
      event_bus_(bus),
      options_(std::move(options)) {}

SessionRegistry::~SessionRegistry() {
    std::lock_guard lock(map_mutex_);
    if (!sessions_.empty()) {
        spdlog::info("Leaving {} mirroring process(es) running", sessions_.size());
    }
}

std::shared_ptr<std::mutex> SessionRegistry::key_mutex(const SessionKey& key) {
    std::lock_guard lock(map_mutex_);
    auto& slot = key_mutexes_[key];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

void SessionRegistry::remember_ended_locked(Session snapshot) {
    snapshot.ended_at = std::chrono::system_clock::now();
    ended_.push_front(std::move(snapshot));
    while (ended_.size() > options_.ended_capacity) {
        ended_.pop_back();
    }
}

Result<Session> SessionRegistry::start(const std::string& device_id, Mode mode, const SessionOptions& options) {
    if (device_id.empty()) {
        return Err<Session>(ErrorKind::InvalidArgument, "Device identifier must not be empty");
    }
    if (!devices_.is_ready(device_id)) {
        return Err<Session>(ErrorKind::DeviceUnready, "Device " + device_id + " is not ready");
    }

    const SessionKey key{device_id, mode};
    const auto guard_mutex = key_mutex(key);
    std::lock_guard key_guard(*guard_mutex);

    auto entry = std::make_shared<Entry>();
    {
        std::lock_guard lock(map_mutex_);
        if (sessions_.count(key) > 0) {
            return Err<Session>(ErrorKind::DuplicateSession,
                                std::string(mode == Mode::Camera ? "Camera" : "Mirror") +
                                " session already active for device " + device_id);
        }
        entry->info.session_id = ++session_counter_;
        entry->info.device_id = device_id;
        entry->info.mode = mode;
        entry->info.options = options;
        entry->info.state = SessionState::Starting;
        sessions_.emplace(key, entry);
    }

    auto spawned = runner_.spawn(make_scrcpy_command(options_.scrcpy_path, device_id, mode, options));
    if (spawned.is_error()) {
        std::lock_guard lock(map_mutex_);
        sessions_.erase(key);
        spdlog::warn("Failed to start {} session: {}", describe_key(key), spawned.error().message);
        return Err<Session>(spawned.error());
    }

    Session snapshot;
    {
        std::lock_guard lock(map_mutex_);
        entry->process = std::shared_ptr<process::Process>(std::move(spawned.value()));
        entry->info.pid = entry->process->pid();
        entry->info.started_at = std::chrono::system_clock::now();
        if (auto res = transition(entry->info, SessionState::Running); res.is_error()) {
            return Err<Session>(res.error());
        }
        snapshot = entry->info;
    }

    event_bus_.emit(events::SessionStartedEvent{snapshot});
    return Ok(snapshot);
}

Result<void> SessionRegistry::stop(const std::string& device_id, Mode mode,
                                   std::optional<std::uint64_t> expected_session_id) {
    const SessionKey key{device_id, mode};
    const auto guard_mutex = key_mutex(key);
    std::lock_guard key_guard(*guard_mutex);

    std::shared_ptr<Entry> entry;
    {
        std::lock_guard lock(map_mutex_);
        auto it = sessions_.find(key);
        if (it == sessions_.end() ||
            (expected_session_id && it->second->info.session_id != *expected_session_id)) {
            return Err<void>(ErrorKind::SessionNotFound,
                             std::string("No active ") + to_string(mode) +
                             " session for device " + device_id);
        }
        entry = it->second;
        if (auto res = transition(entry->info, SessionState::Stopping); res.is_error()) {
            return res;
        }
    }

    spdlog::debug("Stopping {} session {} (pid={})", describe_key(key), entry->info.session_id, entry->info.pid);
    entry->process->terminate(options_.terminate_grace);

    Session snapshot;
    {
        std::lock_guard lock(map_mutex_);
        entry->info.exit_code = entry->process->exit_code();
        if (auto res = transition(entry->info, SessionState::Terminated); res.is_error()) {
            spdlog::error("{}", res.error().message);
        }
        sessions_.erase(key);
        snapshot = entry->info;
        remember_ended_locked(snapshot);
    }

    event_bus_.emit(events::SessionStoppedEvent{snapshot});
    return Ok();
}

std::size_t SessionRegistry::stop_all() {
    std::vector<Session> live = list_all();
    std::size_t stopped = 0;
    for (const auto& session : live) {
        auto res = stop(session.device_id, session.mode, session.session_id);
        if (res.is_ok()) {
            ++stopped;
        } else {
            spdlog::debug("Session {} ended before stop_all reached it: {}",
                          session.session_id, res.error().message);
        }
    }
    return stopped;
}

std::vector<Session> SessionRegistry::list(Mode mode) const {
    std::vector<Session> result;
    {
        std::lock_guard lock(map_mutex_);
        for (const auto& [key, entry] : sessions_) {
            if (key.mode == mode) {
                result.push_back(entry->info);
            }
        }
    }
    sort_by_device(result);
    return result;
}

std::vector<Session> SessionRegistry::list_all() const {
    std::vector<Session> result;
    {
        std::lock_guard lock(map_mutex_);
        result.reserve(sessions_.size());
        for (const auto& [key, entry] : sessions_) {
            result.push_back(entry->info);
        }
    }
    sort_by_device(result);
    return result;
}

std::optional<Session> SessionRegistry::last_known(const std::string& device_id, Mode mode) const {
    std::lock_guard lock(map_mutex_);
    for (const auto& snapshot : ended_) {
        if (snapshot.device_id == device_id && snapshot.mode == mode) {
            return snapshot;
        }
    }
    return std::nullopt;
}

std::vector<SessionRegistry::RunningHandle> SessionRegistry::running_handles() const {
    std::vector<RunningHandle> handles;
    std::lock_guard lock(map_mutex_);
    for (const auto& [key, entry] : sessions_) {
        if (entry->info.state == SessionState::Running && entry->process) {
            handles.push_back(RunningHandle{key, entry->info.session_id, entry->process});
        }
    }
    return handles;
}

bool SessionRegistry::mark_crashed(const SessionKey& key, std::uint64_t session_id) {
    const auto guard_mutex = key_mutex(key);
    std::lock_guard key_guard(*guard_mutex);

    Session snapshot;
    {
        std::lock_guard lock(map_mutex_);
        auto it = sessions_.find(key);
        if (it == sessions_.end() || it->second->info.session_id != session_id) {
            return false;
        }
        auto& entry = *it->second;
        if (entry.info.state != SessionState::Running || entry.process->is_alive()) {
            return false;
        }
        entry.info.exit_code = entry.process->exit_code();
        if (auto res = transition(entry.info, SessionState::Crashed); res.is_error()) {
            spdlog::error("{}", res.error().message);
            return false;
        }
        snapshot = entry.info;
        sessions_.erase(it);
        remember_ended_locked(snapshot);
    }

    event_bus_.emit(events::SessionCrashedEvent{snapshot});
    return true;
}

} // namespace gesu::session
