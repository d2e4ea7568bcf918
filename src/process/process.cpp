#include "gesu/process/process.hpp"

#include <sstream>

namespace gesu::process {

std::string render(const CommandLine& command) {
    std::ostringstream oss;
    oss << command.executable;
    for (const auto& arg : command.args) {
        if (arg.find_first_of(" \t\"") == std::string::npos && !arg.empty()) {
            oss << ' ' << arg;
        } else {
            oss << " \"" << arg << '"';
        }
    }
    return oss.str();
}

} // namespace gesu::process
