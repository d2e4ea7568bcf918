#include "gesu/process/executable.hpp"

#include <cstdlib>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace gesu::process {
namespace fs = std::filesystem;

namespace {

bool is_executable_file(const fs::path& candidate) {
    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec)) {
        return false;
    }
    return ::access(candidate.c_str(), X_OK) == 0;
}

} // namespace

Result<fs::path> resolve_executable(const std::string& configured) {
    if (configured.empty()) {
        return Err<fs::path>(ErrorKind::Spawn, "Executable path is not configured");
    }

    if (configured.find('/') != std::string::npos) {
        const fs::path path{configured};
        if (!is_executable_file(path)) {
            return Err<fs::path>(ErrorKind::Spawn, "Not an executable file: " + configured);
        }
        return Ok(path);
    }

    const char* env_path = std::getenv("PATH");
    if (env_path == nullptr) {
        return Err<fs::path>(ErrorKind::Spawn, "PATH is not set; cannot locate " + configured);
    }

    std::istringstream dirs{env_path};
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        const fs::path candidate = fs::path(dir) / configured;
        if (is_executable_file(candidate)) {
            return Ok(candidate);
        }
    }

    return Err<fs::path>(ErrorKind::Spawn, configured + " not found on PATH");
}

} // namespace gesu::process
