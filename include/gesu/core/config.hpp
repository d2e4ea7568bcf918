#pragma once

#include "gesu/core/result.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace gesu {

/**
 * @brief Runtime configuration of the orchestration core
 *
 * Loaded once at startup from a JSON file. Keys that are absent keep the
 * defaults below; keys with the wrong type are rejected.
 *
 * EXAMPLE:
 * {
 *   "adb_path": "/opt/platform-tools/adb",
 *   "scrcpy_path": "scrcpy",
 *   "per_device_concurrency": 1,
 *   "monitor_interval_ms": 2000
 * }
 */
struct Config {
    std::string adb_path = "adb";        ///< Bare names are searched on PATH
    std::string scrcpy_path = "scrcpy";
    std::string default_device_dir = "Download/GesuBridge";

    std::size_t per_device_concurrency = 1;
    std::size_t transfer_workers = 4;
    std::size_t history_capacity = 50;
    std::size_t ended_session_capacity = 16;

    std::chrono::milliseconds monitor_interval{2000};
    std::chrono::milliseconds terminate_grace{3000};

    /// Stop every mirroring process when the orchestrator exits cleanly
    bool stop_sessions_on_exit = false;

    static Result<Config> load(const std::filesystem::path& path);
    static Result<Config> from_json(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json to_json() const;
};

} // namespace gesu
