#pragma once

#include "gesu/core/result.hpp"
#include "gesu/process/process.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gesu::device {

enum class DeviceState {
    Ready,
    Unauthorized,
    Offline,
    Unknown
};

DeviceState parse_device_state(std::string_view token);
const char* to_string(DeviceState state) noexcept;

struct Device {
    std::string serial;
    DeviceState state = DeviceState::Unknown;
    std::optional<std::string> model;
    std::optional<std::string> manufacturer;
};

/**
 * @brief Parse the output of `adb devices -l`
 *
 * EXAMPLE INPUT:
 * List of devices attached
 * emulator-5554   device product:sdk_gphone64 model:sdk_gphone64 transport_id:1
 * RFCT80XXXXX     unauthorized
 *
 * Lines that do not carry at least a serial and a state are skipped.
 */
std::vector<Device> parse_devices_output(std::string_view output);

/**
 * @brief Device-info collaborator consulted before start/submit
 *
 * The core only needs to know whether a device is reachable and ready;
 * the metadata is exposed for the UI's device list.
 */
class DeviceProbe {
public:
    virtual ~DeviceProbe() = default;

    virtual Result<std::vector<Device>> list_devices() = 0;

    /// True when list_devices() reports @p serial in the Ready state
    virtual bool is_ready(const std::string& serial);
};

/**
 * @brief DeviceProbe that asks adb
 */
class AdbDeviceProbe final : public DeviceProbe {
public:
    AdbDeviceProbe(process::ProcessRunner& runner, std::string adb_path);

    Result<std::vector<Device>> list_devices() override;

private:
    process::ProcessRunner& runner_;
    std::string adb_path_;
};

} // namespace gesu::device
