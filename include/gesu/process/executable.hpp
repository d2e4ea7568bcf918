#pragma once

#include "gesu/core/result.hpp"

#include <filesystem>
#include <string>

namespace gesu::process {

/**
 * @brief Resolve a configured tool path to an executable file
 *
 * A value containing a '/' is checked as-is; a bare name is looked up in
 * each directory of the PATH environment variable. An empty value means
 * the tool is not configured.
 *
 * RETURNS: Absolute or as-given path, or ErrorKind::Spawn
 */
Result<std::filesystem::path> resolve_executable(const std::string& configured);

} // namespace gesu::process
