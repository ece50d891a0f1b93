#include "runfiles/path_utils.hpp"

#include <cctype>
#include <string>

namespace runfiles {

namespace {

#ifdef _WIN32
bool has_drive_prefix(const std::string& s) {
    return s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':';
}
#endif

} // namespace

bool is_absolute_path(const std::string& path) {
    if (path.empty()) {
        return false;
    }
    if (path[0] == '/') {
        return true;
    }
#ifdef _WIN32
    if (path[0] == '\\' || has_drive_prefix(path)) {
        return true;
    }
#endif
    return false;
}

PathError validate_logical_path(const std::string& path) {
    if (path.empty()) {
        return PathError::Empty;
    }
    if (path.find("..") != std::string::npos) {
        return PathError::ContainsUplevel;
    }
    if (is_absolute_path(path)) {
        return PathError::AbsoluteNotAllowed;
    }
    return PathError::None;
}

std::string join_path(const std::string& base, const std::string& rel) {
    if (!base.empty() && base.back() == '/') {
        return base + rel;
    }
    return base + "/" + rel;
}

} // namespace runfiles
