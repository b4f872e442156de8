#include "path_utils.h"
#include <cstdlib>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace job_diary {

std::string expand_path(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    if (path.size() == 1) return std::string(home);
    if (path[1] == '/' || path[1] == '\\') return std::string(home) + path.substr(1);
    return path;
}

std::string default_data_dir() {
    const char* override_dir = std::getenv("JOBDIARY_HOME");
    if (override_dir && *override_dir) return std::string(override_dir);
    return expand_path("~/.jobdiary");
}

bool ensure_parent_dir(const std::string& file_path) {
    fs::path parent = fs::path(file_path).parent_path();
    if (parent.empty()) return true;
    std::error_code ec;
    if (fs::is_directory(parent, ec)) return true;
    fs::create_directories(parent, ec);
    return !ec;
}

} // namespace job_diary
