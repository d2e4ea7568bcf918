#include "gesu/session/scrcpy_command.hpp"

namespace gesu::session {

std::vector<std::string> build_scrcpy_args(const std::string& device_id,
                                           Mode mode,
                                           const SessionOptions& options) {
    std::vector<std::string> args{"-s", device_id};

    if (mode == Mode::Mirror) {
        if (options.turn_screen_off) {
            args.emplace_back("--turn-screen-off");
        }
        return args;
    }

    const bool front = options.camera_facing == "front";
    args.emplace_back("--video-source=camera");
    args.emplace_back(std::string("--camera-facing=") + (front ? "front" : "back"));

    if (!options.camera_size.empty()) {
        args.emplace_back("--camera-size=" + options.camera_size);
    }
    if (options.no_audio) {
        args.emplace_back("--no-audio");
    }
    if (options.orientation == "portrait") {
        args.emplace_back(front ? "--orientation=270" : "--orientation=90");
    }
    return args;
}

process::CommandLine make_scrcpy_command(const std::string& scrcpy_path,
                                         const std::string& device_id,
                                         Mode mode,
                                         const SessionOptions& options) {
    return process::CommandLine{scrcpy_path, build_scrcpy_args(device_id, mode, options), false};
}

} // namespace gesu::session
