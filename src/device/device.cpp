#include "gesu/device/device.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace gesu::device {
namespace {

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

} // namespace

DeviceState parse_device_state(std::string_view token) {
    const auto lowered = to_lower(token);
    if (lowered == "device") {
        return DeviceState::Ready;
    }
    if (lowered == "unauthorized") {
        return DeviceState::Unauthorized;
    }
    if (lowered == "offline") {
        return DeviceState::Offline;
    }
    return DeviceState::Unknown;
}

const char* to_string(DeviceState state) noexcept {
    switch (state) {
        case DeviceState::Ready:        return "ready";
        case DeviceState::Unauthorized: return "unauthorized";
        case DeviceState::Offline:      return "offline";
        case DeviceState::Unknown:      return "unknown";
    }
    return "unknown";
}

std::vector<Device> parse_devices_output(std::string_view output) {
    std::vector<Device> devices;
    std::istringstream lines{std::string(output)};
    std::string line;

    while (std::getline(lines, line)) {
        if (line.rfind("List of devices", 0) == 0 || line.rfind("* daemon", 0) == 0) {
            continue;
        }

        std::istringstream parts{line};
        std::string serial;
        std::string state;
        if (!(parts >> serial >> state)) {
            continue;
        }

        Device device;
        device.serial = serial;
        device.state = parse_device_state(state);

        std::string attribute;
        while (parts >> attribute) {
            const auto colon = attribute.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            const auto key = attribute.substr(0, colon);
            auto value = attribute.substr(colon + 1);
            if (key == "model") {
                std::replace(value.begin(), value.end(), '_', ' ');
                device.model = value;
            } else if (key == "manufacturer") {
                device.manufacturer = value;
            }
        }

        devices.push_back(std::move(device));
    }

    return devices;
}

bool DeviceProbe::is_ready(const std::string& serial) {
    auto devices = list_devices();
    if (devices.is_error()) {
        spdlog::warn("Device readiness check for {} failed: {}", serial, devices.error().message);
        return false;
    }
    const auto& list = devices.value();
    return std::any_of(list.begin(), list.end(), [&](const Device& d) {
        return d.serial == serial && d.state == DeviceState::Ready;
    });
}

AdbDeviceProbe::AdbDeviceProbe(process::ProcessRunner& runner, std::string adb_path)
    : runner_(runner), adb_path_(std::move(adb_path)) {}

Result<std::vector<Device>> AdbDeviceProbe::list_devices() {
    auto spawned = runner_.spawn(process::CommandLine{adb_path_, {"devices", "-l"}, true});
    if (spawned.is_error()) {
        return Err<std::vector<Device>>(spawned.error());
    }
    auto& adb = spawned.value();

    std::string output;
    while (auto line = adb->read_line()) {
        output += *line;
        output += '\n';
    }

    const int code = adb->wait_exit();
    if (code != 0) {
        return Err<std::vector<Device>>(ErrorKind::DeviceUnready,
                                        "adb devices exited with code " + std::to_string(code) +
                                        ": " + output);
    }
    return Ok(parse_devices_output(output));
}

} // namespace gesu::device
