#include <gtest/gtest.h>
#include "gesu/events/event_bus.hpp"
#include "gesu/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace gesu::events;
using gesu::session::Mode;
using gesu::transfer::TransferStatus;

namespace {

SessionCrashedEvent crash_of(const std::string& device) {
    SessionCrashedEvent event;
    event.session.device_id = device;
    event.session.mode = Mode::Camera;
    event.session.exit_code = 1;
    return event;
}

} // namespace

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    std::string received;
    bus.subscribe<SessionCrashedEvent>([&](const SessionCrashedEvent& e) {
        received = e.session.device_id;
    });

    bus.emit(crash_of("R58M123"));

    EXPECT_EQ(received, "R58M123");
}

TEST(EventBus, MultipleSubscribers) {
    EventBus bus;

    int count = 0;
    bus.subscribe<SessionCrashedEvent>([&](const SessionCrashedEvent&) { count++; });
    bus.subscribe<SessionCrashedEvent>([&](const SessionCrashedEvent&) { count++; });
    bus.subscribe<SessionCrashedEvent>([&](const SessionCrashedEvent&) { count++; });

    bus.emit(crash_of("DEV1"));

    EXPECT_EQ(count, 3);
    EXPECT_EQ(bus.subscriber_count<SessionCrashedEvent>(), 3u);
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int crashes = 0;
    int progress = 0;
    bus.subscribe<SessionCrashedEvent>([&](const SessionCrashedEvent&) { crashes++; });
    bus.subscribe<TransferProgressEvent>([&](const TransferProgressEvent&) { progress++; });

    bus.emit(crash_of("DEV1"));
    bus.emit(TransferProgressEvent{"transfer-1", 512, 1024});
    bus.emit(crash_of("DEV2"));

    EXPECT_EQ(crashes, 2);
    EXPECT_EQ(progress, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<TransferFinishedEvent>([&](const TransferFinishedEvent&) { count++; });

    bus.emit(TransferFinishedEvent{});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<TransferFinishedEvent>(id);

    bus.emit(TransferFinishedEvent{});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, SubscriptionUnsubscribesWhenDestroyed) {
    EventBus bus;

    int count = 0;
    {
        auto subscription = bus.listen<SessionCrashedEvent>([&](const SessionCrashedEvent&) { count++; });
        EXPECT_TRUE(subscription.active());
        bus.emit(crash_of("DEV1"));
    }
    bus.emit(crash_of("DEV1"));

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<SessionCrashedEvent>(), 0u);
}

TEST(EventBus, MovedSubscriptionKeepsHandler) {
    EventBus bus;

    int count = 0;
    std::vector<Subscription> held;
    {
        auto subscription = bus.listen<SessionCrashedEvent>([&](const SessionCrashedEvent&) { count++; });
        held.push_back(std::move(subscription));
        EXPECT_FALSE(subscription.active());
    }
    bus.emit(crash_of("DEV1"));
    EXPECT_EQ(count, 1);

    held.front().reset();
    bus.emit(crash_of("DEV1"));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(crash_of("DEV1")));
}

TEST(EventBus, ThrowingHandlerDoesNotStopDelivery) {
    EventBus bus;

    int delivered = 0;
    bus.subscribe<TransferQueuedEvent>([](const TransferQueuedEvent&) {
        throw std::runtime_error("ui pipe closed");
    });
    bus.subscribe<TransferQueuedEvent>([&](const TransferQueuedEvent&) { delivered++; });

    EXPECT_NO_THROW(bus.emit(TransferQueuedEvent{}));
    EXPECT_EQ(delivered, 1);
}

TEST(EventBus, HandlerMaySubscribeWhileEmitting) {
    EventBus bus;

    int late = 0;
    bus.subscribe<SessionStartedEvent>([&](const SessionStartedEvent&) {
        bus.subscribe<SessionStoppedEvent>([&](const SessionStoppedEvent&) { late++; });
    });

    bus.emit(SessionStartedEvent{});
    bus.emit(SessionStoppedEvent{});

    EXPECT_EQ(late, 1);
}

TEST(EventBus, ThreadSafety) {
    EventBus bus;
    std::atomic<int> count{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&bus, &count]() {
            bus.subscribe<TransferStartedEvent>([&count](const TransferStartedEvent&) {
                count++;
            });
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    bus.emit(TransferStartedEvent{});

    EXPECT_EQ(count, 10);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<std::uint64_t> bytes{0};

    bus.subscribe<TransferProgressEvent>([&bytes](const TransferProgressEvent& e) {
        bytes += e.transferred_bytes;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&bus]() {
            for (int j = 0; j < 100; ++j) {
                bus.emit(TransferProgressEvent{"transfer-1", 1, std::nullopt});
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(bytes.load(), 800u);
}

TEST(EventBus, Clear) {
    EventBus bus;

    int count = 0;
    bus.subscribe<TransferFinishedEvent>([&](const TransferFinishedEvent& e) {
        if (e.job.status == TransferStatus::Complete) {
            count++;
        }
    });
    bus.clear();

    TransferFinishedEvent event;
    event.job.status = TransferStatus::Complete;
    bus.emit(event);

    EXPECT_EQ(count, 0);
    EXPECT_EQ(bus.subscriber_count<TransferFinishedEvent>(), 0u);
}
