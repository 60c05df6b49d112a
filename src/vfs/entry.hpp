#pragma once

#include <string>
#include <variant>

namespace tvfs::vfs {

/// Namespace node with no content. Exists so that listings of its
/// children succeed and so that mkdir is observable.
struct Directory {
    std::string mount_path; ///< Mount-relative key, e.g. "/docs"
    bool is_directory = true;
    bool is_executable = false;
};

/// Where a leaf's content comes from. The VFS records provenance only;
/// backends resolve it to bytes.
struct LeafData {
    std::string src_filepath; ///< e.g. "plugin://client/notebooks/readme.md"
};

/// Content-bearing node.
struct Leaf {
    std::string mount_path;
    bool is_executable = false;
    LeafData data;
};

using Entry = std::variant<Directory, Leaf>;

inline const std::string& entry_path(const Entry& entry) {
    return std::visit(
        [](const auto& e) -> const std::string& { return e.mount_path; },
        entry);
}

inline bool is_leaf(const Entry& entry) {
    return std::holds_alternative<Leaf>(entry);
}

inline bool is_directory(const Entry& entry) {
    const auto* dir = std::get_if<Directory>(&entry);
    return dir && dir->is_directory;
}

inline bool is_executable(const Entry& entry) {
    return std::visit([](const auto& e) { return e.is_executable; }, entry);
}

} // namespace tvfs::vfs
