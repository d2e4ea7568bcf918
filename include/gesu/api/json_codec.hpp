#pragma once

#include "gesu/core/result.hpp"
#include "gesu/device/device.hpp"
#include "gesu/events/events.hpp"
#include "gesu/session/types.hpp"
#include "gesu/transfer/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace gesu::api {

/**
 * JSON shapes exchanged with the UI process.
 *
 * Timestamps are milliseconds since the Unix epoch. Optional fields are
 * written as null rather than omitted so the UI sees a stable schema.
 */

std::int64_t to_epoch_millis(std::chrono::system_clock::time_point tp);

nlohmann::json to_json(const Error& error);
nlohmann::json to_json(const device::Device& device);
nlohmann::json to_json(const session::SessionOptions& options);
nlohmann::json to_json(const session::Session& session);
nlohmann::json to_json(const transfer::TransferJob& job);

/// Missing keys keep their defaults; wrong types are InvalidArgument
Result<session::SessionOptions> session_options_from_json(const nlohmann::json& j);

// Notifications: {"event": "<name>", "data": {...}}
nlohmann::json to_notification(const events::SessionStartedEvent& event);
nlohmann::json to_notification(const events::SessionStoppedEvent& event);
nlohmann::json to_notification(const events::SessionCrashedEvent& event);
nlohmann::json to_notification(const events::TransferQueuedEvent& event);
nlohmann::json to_notification(const events::TransferStartedEvent& event);
nlohmann::json to_notification(const events::TransferProgressEvent& event);
nlohmann::json to_notification(const events::TransferFinishedEvent& event);

/// One compact protocol line; invalid UTF-8 (device file names, raw tool output) becomes U+FFFD
std::string to_wire(const nlohmann::json& message);

} // namespace gesu::api
