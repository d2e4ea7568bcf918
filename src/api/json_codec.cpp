#include "gesu/api/json_codec.hpp"

namespace gesu::api {
using json = nlohmann::json;

namespace {

template<typename T>
json optional_value(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json optional_time(const std::optional<std::chrono::system_clock::time_point>& tp) {
    return tp ? json(to_epoch_millis(*tp)) : json(nullptr);
}

json notification(const char* name, json data) {
    return json{{"event", name}, {"data", std::move(data)}};
}

} // namespace

std::int64_t to_epoch_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

json to_json(const Error& error) {
    return json{
        {"type", to_string(error.kind)},
        {"message", error.message},
        {"guidance", user_guidance(error.kind)},
    };
}

json to_json(const device::Device& device) {
    return json{
        {"serial", device.serial},
        {"state", device::to_string(device.state)},
        {"model", optional_value(device.model)},
        {"manufacturer", optional_value(device.manufacturer)},
    };
}

json to_json(const session::SessionOptions& options) {
    return json{
        {"turn_screen_off", options.turn_screen_off},
        {"camera_facing", options.camera_facing},
        {"camera_size", options.camera_size},
        {"no_audio", options.no_audio},
        {"orientation", options.orientation},
    };
}

json to_json(const session::Session& session) {
    return json{
        {"session_id", session.session_id},
        {"device_id", session.device_id},
        {"mode", session::to_string(session.mode)},
        {"pid", session.pid},
        {"state", session::to_string(session.state)},
        {"started_at", to_epoch_millis(session.started_at)},
        {"ended_at", optional_time(session.ended_at)},
        {"exit_code", optional_value(session.exit_code)},
        {"options", to_json(session.options)},
    };
}

json to_json(const transfer::TransferJob& job) {
    return json{
        {"id", job.id},
        {"direction", transfer::to_string(job.direction)},
        {"device_id", job.device_id},
        {"source", job.source},
        {"destination", job.destination},
        {"file_name", job.file_name},
        {"status", transfer::to_string(job.status)},
        {"total_bytes", optional_value(job.total_bytes)},
        {"transferred_bytes", job.transferred_bytes},
        {"error", optional_value(job.error)},
        {"created_at", to_epoch_millis(job.created_at)},
        {"started_at", optional_time(job.started_at)},
        {"completed_at", optional_time(job.completed_at)},
    };
}

Result<session::SessionOptions> session_options_from_json(const json& j) {
    session::SessionOptions options;
    if (j.is_null()) {
        return Ok(options);
    }
    if (!j.is_object()) {
        return Err<session::SessionOptions>(ErrorKind::InvalidArgument, "'options' must be an object");
    }
    try {
        options.turn_screen_off = j.value("turn_screen_off", options.turn_screen_off);
        options.camera_facing = j.value("camera_facing", options.camera_facing);
        options.camera_size = j.value("camera_size", options.camera_size);
        options.no_audio = j.value("no_audio", options.no_audio);
        options.orientation = j.value("orientation", options.orientation);
    } catch (const json::exception& e) {
        return Err<session::SessionOptions>(ErrorKind::InvalidArgument,
                                            std::string("Invalid session options: ") + e.what());
    }
    if (options.camera_facing != "front" && options.camera_facing != "back") {
        return Err<session::SessionOptions>(ErrorKind::InvalidArgument,
                                            "camera_facing must be 'front' or 'back'");
    }
    if (options.orientation != "portrait" && options.orientation != "landscape") {
        return Err<session::SessionOptions>(ErrorKind::InvalidArgument,
                                            "orientation must be 'portrait' or 'landscape'");
    }
    return Ok(options);
}

json to_notification(const events::SessionStartedEvent& event) {
    return notification("session_started", to_json(event.session));
}

json to_notification(const events::SessionStoppedEvent& event) {
    return notification("session_stopped", to_json(event.session));
}

json to_notification(const events::SessionCrashedEvent& event) {
    return notification("session_crashed", to_json(event.session));
}

json to_notification(const events::TransferQueuedEvent& event) {
    return notification("transfer_queued", to_json(event.job));
}

json to_notification(const events::TransferStartedEvent& event) {
    return notification("transfer_started", to_json(event.job));
}

json to_notification(const events::TransferProgressEvent& event) {
    return notification("transfer_progress", json{
        {"id", event.job_id},
        {"transferred_bytes", event.transferred_bytes},
        {"total_bytes", optional_value(event.total_bytes)},
    });
}

json to_notification(const events::TransferFinishedEvent& event) {
    auto data = to_json(event.job);
    data["duration_ms"] = event.duration.count();
    return notification("transfer_finished", std::move(data));
}

std::string to_wire(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace gesu::api
