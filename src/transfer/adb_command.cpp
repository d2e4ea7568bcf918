#include "gesu/transfer/adb_command.hpp"

#include <filesystem>

namespace gesu::transfer {
namespace fs = std::filesystem;

namespace {

std::string trim_slashes(std::string text) {
    while (!text.empty() && text.back() == '/') {
        text.pop_back();
    }
    return text;
}

} // namespace

std::string file_name_of(const std::string& path) {
    const auto trimmed = trim_slashes(path);
    const auto slash = trimmed.find_last_of('/');
    std::string name = slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
    return name.empty() ? "unknown" : name;
}

std::string resolve_push_destination(const std::string& device_dir, const std::string& local_path) {
    const bool absolute = !device_dir.empty() && device_dir.front() == '/';
    const std::string dir = trim_slashes(absolute ? device_dir : "/sdcard/" + device_dir);
    return dir + "/" + file_name_of(local_path);
}

std::string resolve_pull_destination(const std::string& local_dir, const std::string& remote_path) {
    return (fs::path(local_dir) / file_name_of(remote_path)).string();
}

process::CommandLine make_adb_transfer_command(const std::string& adb_path,
                                               const std::string& device_id,
                                               Direction direction,
                                               const std::string& source,
                                               const std::string& destination) {
    return process::CommandLine{
        adb_path,
        {"-s", device_id, direction == Direction::Push ? "push" : "pull", source, destination},
        true
    };
}

} // namespace gesu::transfer
