#include "gesu/session/monitor.hpp"
#include "gesu/events/events.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

using namespace std::chrono_literals;
using gesu::ErrorKind;
using gesu::device::DeviceState;
using gesu::events::EventBus;
using gesu::events::SessionCrashedEvent;
using gesu::fakes::FakeDeviceProbe;
using gesu::fakes::FakeProcessRunner;
using gesu::session::Mode;
using gesu::session::RegistryOptions;
using gesu::session::SessionMonitor;
using gesu::session::SessionRegistry;
using gesu::session::SessionState;

namespace {

class SessionMonitorTest : public ::testing::Test {
protected:
    SessionMonitorTest()
        : registry_(runner_, devices_, bus_, RegistryOptions{"scrcpy", 10ms, 8}) {
        devices_.set("DEV1", DeviceState::Ready);
        devices_.set("DEV2", DeviceState::Ready);
    }

    FakeProcessRunner runner_;
    FakeDeviceProbe devices_;
    EventBus bus_;
    SessionRegistry registry_;
};

} // namespace

TEST_F(SessionMonitorTest, PollDetectsCrashedProcess) {
    std::vector<gesu::session::Session> crashed;
    bus_.subscribe<SessionCrashedEvent>([&](const SessionCrashedEvent& e) { crashed.push_back(e.session); });

    ASSERT_TRUE(registry_.start("DEV1", Mode::Mirror).is_ok());
    ASSERT_TRUE(registry_.start("DEV2", Mode::Mirror).is_ok());
    SessionMonitor monitor(registry_, 1h);

    EXPECT_EQ(monitor.poll_once(), 0u);

    runner_.state(0)->exit(1);
    EXPECT_EQ(monitor.poll_once(), 1u);

    const auto remaining = registry_.list(Mode::Mirror);
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].device_id, "DEV2");

    ASSERT_EQ(crashed.size(), 1u);
    EXPECT_EQ(crashed[0].device_id, "DEV1");
    EXPECT_EQ(crashed[0].state, SessionState::Crashed);
    EXPECT_EQ(crashed[0].exit_code, std::optional<int>(1));

    auto last = registry_.last_known("DEV1", Mode::Mirror);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->state, SessionState::Crashed);
}

TEST_F(SessionMonitorTest, CrashFreesKeyForRestart) {
    ASSERT_TRUE(registry_.start("DEV1", Mode::Camera).is_ok());
    SessionMonitor monitor(registry_, 1h);

    runner_.state(0)->exit(0);
    ASSERT_EQ(monitor.poll_once(), 1u);

    auto stop = registry_.stop("DEV1", Mode::Camera);
    ASSERT_TRUE(stop.is_error());
    EXPECT_EQ(stop.error().kind, ErrorKind::SessionNotFound);

    EXPECT_TRUE(registry_.start("DEV1", Mode::Camera).is_ok());
}

TEST_F(SessionMonitorTest, StaleCrashReportIsIgnored) {
    auto first = registry_.start("DEV1", Mode::Mirror);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(registry_.stop("DEV1", Mode::Mirror).is_ok());
    auto second = registry_.start("DEV1", Mode::Mirror);
    ASSERT_TRUE(second.is_ok());

    EXPECT_FALSE(registry_.mark_crashed({"DEV1", Mode::Mirror}, first.value().session_id));
    EXPECT_FALSE(registry_.mark_crashed({"DEV1", Mode::Mirror}, second.value().session_id));
    EXPECT_EQ(registry_.list(Mode::Mirror).size(), 1u);
}

TEST_F(SessionMonitorTest, BackgroundTimerReportsCrash) {
    std::atomic<int> crashes{0};
    bus_.subscribe<SessionCrashedEvent>([&](const SessionCrashedEvent&) { ++crashes; });

    ASSERT_TRUE(registry_.start("DEV1", Mode::Mirror).is_ok());
    SessionMonitor monitor(registry_, 20ms);
    monitor.start();
    EXPECT_TRUE(monitor.running());

    runner_.state(0)->exit(137);
    for (int i = 0; i < 100 && crashes.load() == 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    monitor.stop();

    EXPECT_EQ(crashes.load(), 1);
    EXPECT_FALSE(monitor.running());
    EXPECT_TRUE(registry_.list_all().empty());
}

TEST_F(SessionMonitorTest, StopIsIdempotent) {
    SessionMonitor monitor(registry_, 10ms);
    monitor.start();
    monitor.stop();
    monitor.stop();
    EXPECT_FALSE(monitor.running());
}
