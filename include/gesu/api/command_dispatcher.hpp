#pragma once

#include "gesu/core/result.hpp"
#include "gesu/device/device.hpp"
#include "gesu/session/registry.hpp"
#include "gesu/transfer/queue.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gesu::api {

/**
 * @brief Command handler: structured arguments in, result payload out
 */
using CommandHandler = std::function<Result<nlohmann::json>(const nlohmann::json& args)>;

/**
 * @brief Routes UI commands to the session registry and transfer queue
 *
 * REQUEST:  {"id": 7, "command": "start_session", "args": {"device_id": "R58M", "mode": "camera"}}
 * RESPONSE: {"id": 7, "ok": true, "result": {...}}
 *           {"id": 7, "ok": false, "error": {"type": "DuplicateSessionError", "message": ..., "guidance": ...}}
 *
 * "id" is echoed when present. Arguments are always structured values;
 * nothing is ever passed through a shell.
 */
class CommandDispatcher {
public:
    CommandDispatcher(session::SessionRegistry& sessions,
                      transfer::TransferQueue& transfers,
                      device::DeviceProbe& devices);

    nlohmann::json handle(const nlohmann::json& request);

    /// Parses one request line; malformed JSON yields an InvalidArgument response
    nlohmann::json handle_line(const std::string& line);

    /// Register or replace a command
    void add(const std::string& command, CommandHandler handler);

    [[nodiscard]] std::vector<std::string> commands() const;

private:
    void register_builtin_commands();

    Result<nlohmann::json> start_session(const nlohmann::json& args);
    Result<nlohmann::json> stop_session(const nlohmann::json& args);
    Result<nlohmann::json> list_sessions(const nlohmann::json& args);
    Result<nlohmann::json> last_session(const nlohmann::json& args);
    Result<nlohmann::json> submit_transfer(const nlohmann::json& args);
    Result<nlohmann::json> cancel_transfer(const nlohmann::json& args);
    Result<nlohmann::json> list_transfers(const nlohmann::json& args);
    Result<nlohmann::json> list_devices(const nlohmann::json& args);

    session::SessionRegistry& sessions_;
    transfer::TransferQueue& transfers_;
    device::DeviceProbe& devices_;
    std::unordered_map<std::string, CommandHandler> handlers_;
};

} // namespace gesu::api
