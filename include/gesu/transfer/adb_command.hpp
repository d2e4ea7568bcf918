#pragma once

#include "gesu/process/process.hpp"
#include "gesu/transfer/types.hpp"

#include <string>
#include <vector>

namespace gesu::transfer {

/// Last path component of a host or device path ("unknown" when empty)
std::string file_name_of(const std::string& path);

/**
 * @brief Device path for pushing @p local_path into @p device_dir
 *
 * Relative directories live under /sdcard; an absolute directory is used
 * verbatim. Example: ("Download/GesuBridge", "/tmp/a.jpg") →
 * "/sdcard/Download/GesuBridge/a.jpg"
 */
std::string resolve_push_destination(const std::string& device_dir, const std::string& local_path);

/// Host path for pulling @p remote_path into @p local_dir
std::string resolve_pull_destination(const std::string& local_dir, const std::string& remote_path);

/// adb -s <device> push|pull <source> <destination>
process::CommandLine make_adb_transfer_command(const std::string& adb_path,
                                               const std::string& device_id,
                                               Direction direction,
                                               const std::string& source,
                                               const std::string& destination);

} // namespace gesu::transfer
