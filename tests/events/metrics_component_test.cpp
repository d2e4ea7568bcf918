#include "gesu/events/event_bus.hpp"
#include "gesu/events/components.hpp"
#include "gesu/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using gesu::events::EventBus;
using gesu::events::LoggerComponent;
using gesu::events::MetricsComponent;
using gesu::events::SessionCrashedEvent;
using gesu::events::SessionStartedEvent;
using gesu::events::SessionStoppedEvent;
using gesu::events::TransferFinishedEvent;
using gesu::events::TransferQueuedEvent;
using gesu::transfer::TransferJob;
using gesu::transfer::TransferStatus;

namespace {

TransferFinishedEvent finished(TransferStatus status, std::uint64_t bytes) {
    TransferJob job;
    job.id = "transfer-1";
    job.status = status;
    job.transferred_bytes = bytes;
    return TransferFinishedEvent{job, std::chrono::milliseconds{200}};
}

} // namespace

TEST(MetricsComponentTest, TracksSessionCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(SessionStartedEvent{});
    bus.emit(SessionStartedEvent{});
    bus.emit(SessionStoppedEvent{});
    bus.emit(SessionCrashedEvent{});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.sessions_started.load(), 2u);
    EXPECT_EQ(stats.sessions_stopped.load(), 1u);
    EXPECT_EQ(stats.sessions_crashed.load(), 1u);
}

TEST(MetricsComponentTest, TracksTransferOutcomes) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(TransferQueuedEvent{});
    bus.emit(TransferQueuedEvent{});
    bus.emit(TransferQueuedEvent{});
    bus.emit(finished(TransferStatus::Complete, 1024));
    bus.emit(finished(TransferStatus::Failed, 10));
    bus.emit(finished(TransferStatus::Cancelled, 300));

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.transfers_queued.load(), 3u);
    EXPECT_EQ(stats.transfers_completed.load(), 1u);
    EXPECT_EQ(stats.transfers_failed.load(), 1u);
    EXPECT_EQ(stats.transfers_cancelled.load(), 1u);
    EXPECT_EQ(stats.bytes_transferred.load(), 1024u);
}

TEST(MetricsComponentTest, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<SessionCrashedEvent>(), 2u);
    }
    EXPECT_EQ(bus.subscriber_count<SessionCrashedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<TransferFinishedEvent>(), 0u);
}
