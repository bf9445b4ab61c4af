#pragma once

#include <string>
#include <filesystem>

namespace daypick {
namespace utils {

class PathUtils {
public:
    // 실행 파일의 디렉토리 경로 반환
    static std::filesystem::path getExecutableDir();
    
    // 상대 경로 해석: 현재 작업 디렉토리에 있으면 그대로, 없으면 실행 파일 기준
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

};

} // namespace utils
} // namespace daypick
