#pragma once

#include "gesu/session/registry.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <thread>

namespace gesu::session {

/**
 * @brief Background watcher that detects mirroring processes that died
 *        without a stop request
 *
 * Every interval it probes each Running session's process and reports
 * dead ones through SessionRegistry::mark_crashed(), the same per-key
 * critical section stop() uses, so a crash and a user stop never race.
 *
 * The timer runs on a private io_context serviced by one thread.
 */
class SessionMonitor {
public:
    SessionMonitor(SessionRegistry& registry, std::chrono::milliseconds interval);
    ~SessionMonitor();

    SessionMonitor(const SessionMonitor&) = delete;
    SessionMonitor& operator=(const SessionMonitor&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool running() const;

    /// One detection pass; returns the number of sessions marked crashed
    std::size_t poll_once();

private:
    void schedule_next();

    SessionRegistry& registry_;
    const std::chrono::milliseconds interval_;

    boost::asio::io_context io_context_;
    boost::asio::steady_timer timer_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::thread thread_;

    mutable std::mutex control_mutex_;
    bool running_ = false;
};

} // namespace gesu::session
