#pragma once

#include <filesystem>
#include <string>

namespace gridcycle {
namespace utils {

class PathUtils {
public:
    // 실행 파일 디렉토리 (/proc 없으면 현재 작업 디렉토리)
    static std::filesystem::path getExecutableDir();

    // 절대 경로는 그대로, 상대 경로는 실행 파일 기준
    static std::filesystem::path resolveRelativePath(const std::string& path);

    // 파일을 쓰기 전에 상위 디렉토리 생성. 실패 시 false
    static bool ensureParentDirectory(const std::filesystem::path& file_path, std::string* error = nullptr);
};

} // namespace utils
} // namespace gridcycle
