#include "common/PathUtils.h"

#include <system_error>

namespace gridcycle {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& path) {
    const std::filesystem::path candidate(path);
    if (candidate.is_absolute()) {
        return candidate;
    }
    return getExecutableDir() / candidate;
}

bool PathUtils::ensureParentDirectory(const std::filesystem::path& file_path, std::string* error) {
    if (!file_path.has_parent_path()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
        if (error) {
            *error = ec.message();
        }
        return false;
    }
    return true;
}

} // namespace utils
} // namespace gridcycle
