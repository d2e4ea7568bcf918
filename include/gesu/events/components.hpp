/**
 * @file components.hpp
 * @brief Event-driven observers of the orchestration core
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Session and transfer activity is now logged and counted
 */

#pragma once

#include "gesu/events/event_bus.hpp"
#include "gesu/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <vector>

namespace gesu::events {

/**
 * @brief Logs session and transfer events with spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        subscriptions_.push_back(bus.listen<SessionStartedEvent>([](const SessionStartedEvent& e) {
            spdlog::info("[SessionStarted] id={} device={} mode={} pid={}",
                         e.session.session_id, e.session.device_id,
                         session::to_string(e.session.mode), e.session.pid);
        }));

        subscriptions_.push_back(bus.listen<SessionStoppedEvent>([](const SessionStoppedEvent& e) {
            spdlog::info("[SessionStopped] id={} device={} mode={} exit={}",
                         e.session.session_id, e.session.device_id,
                         session::to_string(e.session.mode), e.session.exit_code.value_or(-1));
        }));

        subscriptions_.push_back(bus.listen<SessionCrashedEvent>([](const SessionCrashedEvent& e) {
            spdlog::warn("[SessionCrashed] id={} device={} mode={} exit={}",
                         e.session.session_id, e.session.device_id,
                         session::to_string(e.session.mode), e.session.exit_code.value_or(-1));
        }));

        subscriptions_.push_back(bus.listen<TransferQueuedEvent>([](const TransferQueuedEvent& e) {
            spdlog::debug("[TransferQueued] id={} {} device={} {} -> {}",
                          e.job.id, transfer::to_string(e.job.direction), e.job.device_id,
                          e.job.source, e.job.destination);
        }));

        subscriptions_.push_back(bus.listen<TransferStartedEvent>([](const TransferStartedEvent& e) {
            spdlog::info("[TransferStarted] id={} {} device={} path={}",
                         e.job.id, transfer::to_string(e.job.direction), e.job.device_id, e.job.source);
        }));

        subscriptions_.push_back(bus.listen<TransferProgressEvent>([](const TransferProgressEvent& e) {
            spdlog::trace("[TransferProgress] id={} bytes={}/{}",
                          e.job_id, e.transferred_bytes, e.total_bytes.value_or(0));
        }));

        subscriptions_.push_back(bus.listen<TransferFinishedEvent>([](const TransferFinishedEvent& e) {
            if (e.job.status == transfer::TransferStatus::Failed) {
                spdlog::warn("[TransferFailed] id={} path={} error={}",
                             e.job.id, e.job.source, e.job.error.value_or(""));
                return;
            }
            spdlog::info("[TransferFinished] id={} status={} bytes={} duration={}ms",
                         e.job.id, transfer::to_string(e.job.status),
                         e.job.transferred_bytes, e.duration.count());
        }));
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    std::vector<Subscription> subscriptions_;
};

/**
 * @brief Counts session and transfer outcomes
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> sessions_started{0};
        std::atomic<uint64_t> sessions_stopped{0};
        std::atomic<uint64_t> sessions_crashed{0};
        std::atomic<uint64_t> transfers_queued{0};
        std::atomic<uint64_t> transfers_completed{0};
        std::atomic<uint64_t> transfers_failed{0};
        std::atomic<uint64_t> transfers_cancelled{0};
        std::atomic<uint64_t> bytes_transferred{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        subscriptions_.push_back(bus.listen<SessionStartedEvent>([this](const SessionStartedEvent&) {
            stats_.sessions_started++;
        }));
        subscriptions_.push_back(bus.listen<SessionStoppedEvent>([this](const SessionStoppedEvent&) {
            stats_.sessions_stopped++;
        }));
        subscriptions_.push_back(bus.listen<SessionCrashedEvent>([this](const SessionCrashedEvent&) {
            stats_.sessions_crashed++;
        }));
        subscriptions_.push_back(bus.listen<TransferQueuedEvent>([this](const TransferQueuedEvent&) {
            stats_.transfers_queued++;
        }));
        subscriptions_.push_back(bus.listen<TransferFinishedEvent>([this](const TransferFinishedEvent& e) {
            on_transfer_finished(e);
        }));
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Bridge Statistics:");
        spdlog::info("  Sessions started:    {}", stats_.sessions_started.load());
        spdlog::info("  Sessions stopped:    {}", stats_.sessions_stopped.load());
        spdlog::info("  Sessions crashed:    {}", stats_.sessions_crashed.load());
        spdlog::info("  Transfers queued:    {}", stats_.transfers_queued.load());
        spdlog::info("  Transfers completed: {}", stats_.transfers_completed.load());
        spdlog::info("  Transfers failed:    {}", stats_.transfers_failed.load());
        spdlog::info("  Transfers cancelled: {}", stats_.transfers_cancelled.load());
        spdlog::info("  Bytes transferred:   {}", stats_.bytes_transferred.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_transfer_finished(const TransferFinishedEvent& e) {
        switch (e.job.status) {
            case transfer::TransferStatus::Complete:
                stats_.transfers_completed++;
                stats_.bytes_transferred += e.job.transferred_bytes;
                break;
            case transfer::TransferStatus::Failed:
                stats_.transfers_failed++;
                break;
            case transfer::TransferStatus::Cancelled:
                stats_.transfers_cancelled++;
                break;
            default:
                break;
        }
    }

    Stats stats_;
    std::vector<Subscription> subscriptions_;
};

} // namespace gesu::events
