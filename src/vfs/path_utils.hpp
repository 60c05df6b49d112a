#pragma once

#include <string>
#include <string_view>

namespace tvfs::vfs {

/// Last path segment. Trailing separators are ignored ("/a/b/" -> "b").
std::string basename(std::string_view path);

/// All segments but the last. "/a" -> "/", "a" -> ".".
std::string dirname(std::string_view path);

/// Join two path fragments with exactly one separator between them.
std::string join(std::string_view base, std::string_view name);

/// Extension of the last segment without the dot, or empty.
std::string extension(std::string_view path);

/// Normalize a virtual path: forward slashes, collapse //, . and ..,
/// leading slash, no trailing slash (unless it's just "/").
std::string normalize(std::string_view path);

/// Precomputed strip/apply of a mount path prefix.
class MountPrefix {
public:
    explicit MountPrefix(std::string mount_path);

    const std::string& mount_path() const { return mount_path_; }

    /// True if path is the mount path itself or lies below it.
    bool matches(std::string_view path) const;

    /// Strip the mount prefix, leaving a "/"-rooted mount-relative path.
    /// Paths without the prefix are taken as already mount-relative.
    std::string strip(std::string_view path) const;

    /// Re-prefix a mount-relative path with the mount path.
    std::string apply(std::string_view relative) const;

private:
    std::string mount_path_; // Normalized, e.g. "/kui" or "/"
};

} // namespace tvfs::vfs
