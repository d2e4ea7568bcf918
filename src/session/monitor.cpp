#include "gesu/session/monitor.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

namespace gesu::session {

SessionMonitor::SessionMonitor(SessionRegistry& registry, std::chrono::milliseconds interval)
    : registry_(registry),
      interval_(interval),
      timer_(io_context_) {}

SessionMonitor::~SessionMonitor() {
    stop();
}

void SessionMonitor::start() {
    std::lock_guard lock(control_mutex_);
    if (running_) {
        return;
    }
    running_ = true;

    io_context_.restart();
    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    boost::asio::post(io_context_, [this]() { schedule_next(); });
    thread_ = std::thread([this]() { io_context_.run(); });

    spdlog::debug("Session monitor started (interval {}ms)", interval_.count());
}

void SessionMonitor::stop() {
    {
        std::lock_guard lock(control_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }

    boost::asio::post(io_context_, [this]() { timer_.cancel(); });
    work_guard_.reset();
    if (thread_.joinable()) {
        thread_.join();
    }
    spdlog::debug("Session monitor stopped");
}

bool SessionMonitor::running() const {
    std::lock_guard lock(control_mutex_);
    return running_;
}

void SessionMonitor::schedule_next() {
    {
        std::lock_guard lock(control_mutex_);
        if (!running_) {
            return;
        }
    }

    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        poll_once();
        schedule_next();
    });
}

std::size_t SessionMonitor::poll_once() {
    std::size_t crashed = 0;
    for (const auto& handle : registry_.running_handles()) {
        if (handle.process->is_alive()) {
            continue;
        }
        if (registry_.mark_crashed(handle.key, handle.session_id)) {
            ++crashed;
        }
    }
    return crashed;
}

} // namespace gesu::session
