#include "path_utils.h"
#include <cstdlib>
#include <string>

namespace voicegate {

std::string expand_path(const std::string& path) {
    if (path.empty()) return path;
    if (path.size() == 1 && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home);
        return path;
    }
    if (path.size() >= 2 && path[0] == '~' && (path[1] == '/' || path[1] == '\\')) {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home) + path.substr(1);
        return path;
    }
    return path;
}

std::string resolve_relative_to(const std::string& base_file, const std::string& path) {
    if (path.empty()) return path;
    std::string expanded = expand_path(path);
    if (expanded[0] == '/' || expanded[0] == '\\' || expanded[0] == '~') {
        return expanded;
    }
    std::string::size_type pos = base_file.find_last_of("/\\");
    if (pos == std::string::npos) {
        return expanded;
    }
    return base_file.substr(0, pos + 1) + expanded;
}

} // namespace voicegate
