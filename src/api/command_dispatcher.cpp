#include "gesu/api/command_dispatcher.hpp"
#include "gesu/api/json_codec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace gesu::api {
using json = nlohmann::json;

namespace {

Result<std::string> required_string(const json& args, const char* key) {
    const auto it = args.find(key);
    if (it == args.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        return Err<std::string>(ErrorKind::InvalidArgument,
                                std::string("Missing or empty string argument '") + key + "'");
    }
    return Ok(it->get<std::string>());
}

Result<session::Mode> required_mode(const json& args) {
    auto text = required_string(args, "mode");
    if (text.is_error()) {
        return Err<session::Mode>(text.error());
    }
    const auto mode = session::parse_mode(text.value());
    if (!mode) {
        return Err<session::Mode>(ErrorKind::InvalidArgument,
                                  "Unknown mode '" + text.value() + "' (expected mirror or camera)");
    }
    return Ok(*mode);
}

json response(const json& request, Result<json> result) {
    json out;
    if (request.is_object() && request.contains("id")) {
        out["id"] = request["id"];
    }
    if (result.is_ok()) {
        out["ok"] = true;
        out["result"] = std::move(result.value());
    } else {
        out["ok"] = false;
        out["error"] = to_json(result.error());
    }
    return out;
}

json array_of(const std::vector<transfer::TransferJob>& jobs) {
    json out = json::array();
    for (const auto& job : jobs) {
        out.push_back(to_json(job));
    }
    return out;
}

} // namespace

CommandDispatcher::CommandDispatcher(session::SessionRegistry& sessions,
                                     transfer::TransferQueue& transfers,
                                     device::DeviceProbe& devices)
    : sessions_(sessions),
      transfers_(transfers),
      devices_(devices) {
    register_builtin_commands();
}

void CommandDispatcher::register_builtin_commands() {
    add("ping", [](const json&) { return Ok(json{{"pong", true}}); });
    add("start_session", [this](const json& args) { return start_session(args); });
    add("stop_session", [this](const json& args) { return stop_session(args); });
    add("list_sessions", [this](const json& args) { return list_sessions(args); });
    add("last_session", [this](const json& args) { return last_session(args); });
    add("submit_transfer", [this](const json& args) { return submit_transfer(args); });
    add("cancel_transfer", [this](const json& args) { return cancel_transfer(args); });
    add("list_transfers", [this](const json& args) { return list_transfers(args); });
    add("list_devices", [this](const json& args) { return list_devices(args); });
}

void CommandDispatcher::add(const std::string& command, CommandHandler handler) {
    handlers_[command] = std::move(handler);
}

std::vector<std::string> CommandDispatcher::commands() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

json CommandDispatcher::handle(const json& request) {
    if (!request.is_object()) {
        return response(request, Err<json>(ErrorKind::InvalidArgument, "Request must be a JSON object"));
    }
    const auto command = required_string(request, "command");
    if (command.is_error()) {
        return response(request, Err<json>(command.error()));
    }

    const auto it = handlers_.find(command.value());
    if (it == handlers_.end()) {
        return response(request, Err<json>(ErrorKind::InvalidArgument, "Unknown command '" + command.value() + "'"));
    }

    const json args = request.value("args", json::object());
    if (!args.is_object()) {
        return response(request, Err<json>(ErrorKind::InvalidArgument, "'args' must be an object"));
    }

    spdlog::debug("Command {}", command.value());
    try {
        auto result = it->second(args);
        if (result.is_error()) {
            spdlog::debug("Command {} failed: {}", command.value(), result.error().describe());
        }
        return response(request, std::move(result));
    } catch (const json::exception& e) {
        return response(request, Err<json>(ErrorKind::InvalidArgument,
                                           "Malformed arguments for " + command.value() + ": " + e.what()));
    }
}

json CommandDispatcher::handle_line(const std::string& line) {
    json request;
    try {
        request = json::parse(line);
    } catch (const json::parse_error& e) {
        return response(json(), Err<json>(ErrorKind::InvalidArgument, std::string("Malformed request: ") + e.what()));
    }
    return handle(request);
}

Result<json> CommandDispatcher::start_session(const json& args) {
    const auto device_id = required_string(args, "device_id");
    if (device_id.is_error()) {
        return Err<json>(device_id.error());
    }
    const auto mode = required_mode(args);
    if (mode.is_error()) {
        return Err<json>(mode.error());
    }
    const auto options = session_options_from_json(args.value("options", json()));
    if (options.is_error()) {
        return Err<json>(options.error());
    }

    auto session = sessions_.start(device_id.value(), mode.value(), options.value());
    if (session.is_error()) {
        return Err<json>(session.error());
    }
    return Ok(to_json(session.value()));
}

Result<json> CommandDispatcher::stop_session(const json& args) {
    const auto device_id = required_string(args, "device_id");
    if (device_id.is_error()) {
        return Err<json>(device_id.error());
    }
    const auto mode = required_mode(args);
    if (mode.is_error()) {
        return Err<json>(mode.error());
    }

    std::optional<std::uint64_t> expected;
    if (args.contains("session_id") && !args["session_id"].is_null()) {
        expected = args["session_id"].get<std::uint64_t>();
    }

    auto stopped = sessions_.stop(device_id.value(), mode.value(), expected);
    if (stopped.is_error()) {
        return Err<json>(stopped.error());
    }
    return Ok(json{{"stopped", true}});
}

Result<json> CommandDispatcher::list_sessions(const json& args) {
    std::vector<session::Session> sessions;
    if (args.contains("mode")) {
        const auto mode = required_mode(args);
        if (mode.is_error()) {
            return Err<json>(mode.error());
        }
        sessions = sessions_.list(mode.value());
    } else {
        sessions = sessions_.list_all();
    }

    json out = json::array();
    for (const auto& session : sessions) {
        out.push_back(to_json(session));
    }
    return Ok(std::move(out));
}

Result<json> CommandDispatcher::last_session(const json& args) {
    const auto device_id = required_string(args, "device_id");
    if (device_id.is_error()) {
        return Err<json>(device_id.error());
    }
    const auto mode = required_mode(args);
    if (mode.is_error()) {
        return Err<json>(mode.error());
    }

    const auto session = sessions_.last_known(device_id.value(), mode.value());
    return Ok(session ? to_json(*session) : json(nullptr));
}

Result<json> CommandDispatcher::submit_transfer(const json& args) {
    const auto device_id = required_string(args, "device_id");
    if (device_id.is_error()) {
        return Err<json>(device_id.error());
    }
    const auto direction_text = required_string(args, "direction");
    if (direction_text.is_error()) {
        return Err<json>(direction_text.error());
    }
    const auto direction = transfer::parse_direction(direction_text.value());
    if (!direction) {
        return Err<json>(ErrorKind::InvalidArgument,
                         "Unknown direction '" + direction_text.value() + "' (expected push or pull)");
    }

    const auto paths_it = args.find("paths");
    if (paths_it == args.end() || !paths_it->is_array()) {
        return Err<json>(ErrorKind::InvalidArgument, "'paths' must be an array of strings");
    }
    const auto paths = paths_it->get<std::vector<std::string>>();
    const std::string dest = args.value("dest", std::string());

    auto jobs = *direction == transfer::Direction::Push
        ? transfers_.submit_push(device_id.value(), paths, dest)
        : transfers_.submit_pull(device_id.value(), paths, dest);
    if (jobs.is_error()) {
        return Err<json>(jobs.error());
    }
    return Ok(array_of(jobs.value()));
}

Result<json> CommandDispatcher::cancel_transfer(const json& args) {
    const auto job_id = required_string(args, "job_id");
    if (job_id.is_error()) {
        return Err<json>(job_id.error());
    }
    auto cancelled = transfers_.cancel(job_id.value());
    if (cancelled.is_error()) {
        return Err<json>(cancelled.error());
    }

    const auto job = transfers_.find(job_id.value());
    return Ok(job ? to_json(*job) : json(nullptr));
}

Result<json> CommandDispatcher::list_transfers(const json&) {
    return Ok(json{
        {"active", array_of(transfers_.list_active())},
        {"history", array_of(transfers_.list_history())},
    });
}

Result<json> CommandDispatcher::list_devices(const json&) {
    auto devices = devices_.list_devices();
    if (devices.is_error()) {
        return Err<json>(devices.error());
    }
    json out = json::array();
    for (const auto& device : devices.value()) {
        out.push_back(to_json(device));
    }
    return Ok(std::move(out));
}

} // namespace gesu::api
