/**
 * @file bridge_sidecar.cpp
 * @brief Orchestration process driven by the desktop UI over stdio
 *
 * PROTOCOL:
 * - stdin:  one JSON request per line, see api::CommandDispatcher
 * - stdout: one JSON response per request, plus {"event": ...}
 *           notifications as sessions and transfers change state
 * - stderr: logs
 *
 * The process exits when stdin is closed or on SIGINT/SIGTERM.
 */

#include "gesu/api/command_dispatcher.hpp"
#include "gesu/api/json_codec.hpp"
#include "gesu/core/config.hpp"
#include "gesu/device/device.hpp"
#include "gesu/events/components.hpp"
#include "gesu/events/event_bus.hpp"
#include "gesu/events/event_queue.hpp"
#include "gesu/events/events.hpp"
#include "gesu/process/posix_process.hpp"
#include "gesu/session/monitor.hpp"
#include "gesu/session/registry.hpp"
#include "gesu/transfer/queue.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace gesu;
using json = nlohmann::json;

namespace {

void signal_handler(int) {
    // Unblocks std::getline on stdin; the main loop then shuts down
    ::close(STDIN_FILENO);
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options]\n"
              << "  --config <file>   JSON configuration file\n"
              << "  --adb <path>      adb executable (overrides config)\n"
              << "  --scrcpy <path>   scrcpy executable (overrides config)\n"
              << "  --verbose         debug logging\n"
              << "  --help            show this message\n";
}

struct Options {
    std::optional<std::string> config_path;
    std::optional<std::string> adb_path;
    std::optional<std::string> scrcpy_path;
    bool verbose = false;
};

/// Forwards every event to the UI as a notification line
class NotificationForwarder {
public:
    NotificationForwarder(events::EventBus& bus, events::ThreadSafeQueue<std::string>& out)
        : out_(out) {
        forward<events::SessionStartedEvent>(bus);
        forward<events::SessionStoppedEvent>(bus);
        forward<events::SessionCrashedEvent>(bus);
        forward<events::TransferQueuedEvent>(bus);
        forward<events::TransferStartedEvent>(bus);
        forward<events::TransferProgressEvent>(bus);
        forward<events::TransferFinishedEvent>(bus);
    }

    NotificationForwarder(const NotificationForwarder&) = delete;
    NotificationForwarder& operator=(const NotificationForwarder&) = delete;

private:
    template<typename EventType>
    void forward(events::EventBus& bus) {
        subscriptions_.push_back(bus.listen<EventType>([this](const EventType& event) {
            out_.push(api::to_wire(api::to_notification(event)));
        }));
    }

    events::ThreadSafeQueue<std::string>& out_;
    std::vector<events::Subscription> subscriptions_;
};

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("gesu"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    Options cli;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--verbose" || arg == "-v") {
            cli.verbose = true;
        } else if (arg == "--config" && has_value) {
            cli.config_path = argv[++i];
        } else if (arg == "--adb" && has_value) {
            cli.adb_path = argv[++i];
        } else if (arg == "--scrcpy" && has_value) {
            cli.scrcpy_path = argv[++i];
        } else {
            spdlog::error("Unknown or incomplete option: {}", arg);
            print_usage(argv[0]);
            return 2;
        }
    }
    if (cli.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    Config config;
    if (cli.config_path) {
        auto loaded = Config::load(*cli.config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().describe());
            return 1;
        }
        config = loaded.value();
    }
    if (cli.adb_path) {
        config.adb_path = *cli.adb_path;
    }
    if (cli.scrcpy_path) {
        config.scrcpy_path = *cli.scrcpy_path;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    events::ThreadSafeQueue<std::string> out;
    std::thread writer([&out] {
        while (auto line = out.pop()) {
            std::cout << *line << '\n' << std::flush;
        }
    });
    NotificationForwarder forwarder(bus, out);

    process::PosixProcessRunner runner;
    device::AdbDeviceProbe devices(runner, config.adb_path);

    session::SessionRegistry registry(runner, devices, bus, session::RegistryOptions{
        config.scrcpy_path, config.terminate_grace, config.ended_session_capacity});

    std::optional<transfer::TransferQueue> transfers;
    transfers.emplace(runner, devices, bus, transfer::QueueOptions{
        config.adb_path, config.default_device_dir, config.per_device_concurrency,
        config.transfer_workers, config.history_capacity, config.terminate_grace});

    session::SessionMonitor monitor(registry, config.monitor_interval);
    monitor.start();

    api::CommandDispatcher dispatcher(registry, *transfers, devices);
    spdlog::info("Bridge ready (adb={}, scrcpy={})", config.adb_path, config.scrcpy_path);

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        out.push(api::to_wire(dispatcher.handle_line(line)));
    }

    spdlog::info("Input closed, shutting down");
    monitor.stop();
    if (config.stop_sessions_on_exit) {
        const auto stopped = registry.stop_all();
        spdlog::info("Stopped {} session(s)", stopped);
    }
    transfers.reset();

    metrics.print_stats();
    out.shutdown();
    writer.join();
    return 0;
}
