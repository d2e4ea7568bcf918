#pragma once

#include "gesu/process/process.hpp"
#include "gesu/session/types.hpp"

#include <string>
#include <vector>

namespace gesu::session {

/**
 * @brief Argument list for one mirroring invocation
 *
 * Always starts with "-s <device>". Camera sessions select the camera
 * video source; portrait orientation rotates the landscape sensor output
 * by 90° (back camera) or 270° (front camera).
 */
std::vector<std::string> build_scrcpy_args(const std::string& device_id,
                                           Mode mode,
                                           const SessionOptions& options);

process::CommandLine make_scrcpy_command(const std::string& scrcpy_path,
                                         const std::string& device_id,
                                         Mode mode,
                                         const SessionOptions& options);

} // namespace gesu::session
