#include "gesu/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>

namespace gesu {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template<typename T>
bool read_key(const json& j, const char* key, T& out, std::string& error) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return true;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        error = std::string("Invalid value for '") + key + "': " + e.what();
        return false;
    }
    return true;
}

bool read_count(const json& j, const char* key, std::size_t& out, std::string& error) {
    std::int64_t raw = static_cast<std::int64_t>(out);
    if (!read_key(j, key, raw, error)) {
        return false;
    }
    if (raw < 1) {
        error = std::string("'") + key + "' must be at least 1";
        return false;
    }
    out = static_cast<std::size_t>(raw);
    return true;
}

bool read_millis(const json& j, const char* key, std::chrono::milliseconds& out, std::string& error) {
    std::int64_t raw = out.count();
    if (!read_key(j, key, raw, error)) {
        return false;
    }
    if (raw < 0) {
        error = std::string("'") + key + "' must not be negative";
        return false;
    }
    out = std::chrono::milliseconds{raw};
    return true;
}

} // namespace

Result<Config> Config::from_json(const json& j) {
    if (!j.is_object()) {
        return Err<Config>(ErrorKind::Config, "Configuration root must be a JSON object");
    }

    Config config;
    std::string error;
    const bool ok =
        read_key(j, "adb_path", config.adb_path, error) &&
        read_key(j, "scrcpy_path", config.scrcpy_path, error) &&
        read_key(j, "default_device_dir", config.default_device_dir, error) &&
        read_count(j, "per_device_concurrency", config.per_device_concurrency, error) &&
        read_count(j, "transfer_workers", config.transfer_workers, error) &&
        read_count(j, "history_capacity", config.history_capacity, error) &&
        read_count(j, "ended_session_capacity", config.ended_session_capacity, error) &&
        read_millis(j, "monitor_interval_ms", config.monitor_interval, error) &&
        read_millis(j, "terminate_grace_ms", config.terminate_grace, error) &&
        read_key(j, "stop_sessions_on_exit", config.stop_sessions_on_exit, error);

    if (!ok) {
        return Err<Config>(ErrorKind::Config, error);
    }
    if (config.monitor_interval.count() == 0) {
        return Err<Config>(ErrorKind::Config, "'monitor_interval_ms' must be greater than 0");
    }
    return Ok(config);
}

Result<Config> Config::load(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<Config>(ErrorKind::Config, "Failed to open configuration file: " + path.string());
    }

    json j;
    try {
        input >> j;
    } catch (const json::parse_error& e) {
        return Err<Config>(ErrorKind::Config,
                           "Failed to parse " + path.string() + ": " + e.what());
    }

    auto config = from_json(j);
    if (config.is_ok()) {
        spdlog::debug("Loaded configuration from {}", path.string());
    }
    return config;
}

json Config::to_json() const {
    return json{
        {"adb_path", adb_path},
        {"scrcpy_path", scrcpy_path},
        {"default_device_dir", default_device_dir},
        {"per_device_concurrency", per_device_concurrency},
        {"transfer_workers", transfer_workers},
        {"history_capacity", history_capacity},
        {"ended_session_capacity", ended_session_capacity},
        {"monitor_interval_ms", monitor_interval.count()},
        {"terminate_grace_ms", terminate_grace.count()},
        {"stop_sessions_on_exit", stop_sessions_on_exit},
    };
}

} // namespace gesu
