#include "vfs/path_utils.hpp"

#include <algorithm>

namespace tvfs::vfs {

std::string basename(std::string_view path) {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    if (path == "/") return "/";

    auto last_sep = path.rfind('/');
    if (last_sep == std::string_view::npos) {
        return std::string(path);
    }
    return std::string(path.substr(last_sep + 1));
}

std::string dirname(std::string_view path) {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }

    auto last_sep = path.rfind('/');
    if (last_sep == std::string_view::npos) {
        return ".";
    }
    if (last_sep == 0) {
        return "/";
    }
    return std::string(path.substr(0, last_sep));
}

std::string join(std::string_view base, std::string_view name) {
    if (base.empty()) return std::string(name);
    if (name.empty()) return std::string(base);

    std::string result(base);
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    while (!name.empty() && name.front() == '/') {
        name.remove_prefix(1);
    }
    if (result.back() != '/') {
        result += '/';
    }
    result += name;
    return result;
}

std::string extension(std::string_view path) {
    auto name = basename(path);
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == name.size()) {
        return {};
    }
    return name.substr(dot + 1);
}

std::string normalize(std::string_view path) {
    std::string result(path);

    // Forward slashes
    std::replace(result.begin(), result.end(), '\\', '/');

    // Collapse // into /
    std::string collapsed;
    collapsed.reserve(result.size());
    for (size_t i = 0; i < result.size(); i++) {
        if (result[i] == '/' && !collapsed.empty() && collapsed.back() == '/') {
            continue;
        }
        collapsed += result[i];
    }
    result = collapsed;

    // Trailing /. and /.. become /./ and /../ so the passes below see them
    if (result.size() >= 2 && result.compare(result.size() - 2, 2, "/.") == 0) {
        result += '/';
    } else if (result.size() >= 3 &&
               result.compare(result.size() - 3, 3, "/..") == 0) {
        result += '/';
    }

    // Collapse /./
    while (true) {
        auto pos = result.find("/./");
        if (pos == std::string::npos) break;
        result.erase(pos, 2);
    }

    // Collapse /../
    while (true) {
        auto pos = result.find("/../");
        if (pos == std::string::npos) break;
        if (pos == 0) {
            result.erase(0, 3);
            continue;
        }
        auto parent = result.rfind('/', pos - 1);
        if (parent == std::string::npos) {
            result.erase(0, pos + 4);
        } else {
            result.erase(parent, pos - parent + 3);
        }
    }

    // Ensure leading slash
    if (result.empty() || result[0] != '/') {
        result = "/" + result;
    }

    // Remove trailing slash (unless it's just "/")
    if (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }

    return result;
}

MountPrefix::MountPrefix(std::string mount_path)
    : mount_path_(normalize(mount_path)) {}

bool MountPrefix::matches(std::string_view path) const {
    if (mount_path_ == "/") {
        return !path.empty() && path[0] == '/';
    }
    if (path.size() < mount_path_.size() ||
        path.compare(0, mount_path_.size(), mount_path_) != 0) {
        return false;
    }
    // The character after the mount path must be '/' or end of string
    return path.size() == mount_path_.size() || path[mount_path_.size()] == '/';
}

std::string MountPrefix::strip(std::string_view path) const {
    if (mount_path_ != "/" && matches(path)) {
        path.remove_prefix(mount_path_.size());
    }
    if (path.empty()) {
        return "/";
    }
    if (path[0] != '/') {
        return "/" + std::string(path);
    }
    return std::string(path);
}

std::string MountPrefix::apply(std::string_view relative) const {
    if (mount_path_ == "/") {
        return std::string(relative);
    }
    if (relative == "/") {
        return mount_path_;
    }
    return mount_path_ + std::string(relative);
}

} // namespace tvfs::vfs
