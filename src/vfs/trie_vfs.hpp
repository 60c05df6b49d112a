#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "vfs/content_backend.hpp"
#include "vfs/entry.hpp"
#include "vfs/path_utils.hpp"
#include "vfs/trie_index.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tvfs::vfs {

/// Sentinel owner ids; this is not a real filesystem.
constexpr i32 VIRTUAL_UID = -1;
constexpr i32 VIRTUAL_GID = -1;

struct LsOptions {
    bool directory_only = false; ///< ls -d: list the entry itself, not its children
};

struct FileStats {
    u64 size = 0;
    i64 mtime_ms = 0;
    i32 uid = VIRTUAL_UID;
    i32 gid = VIRTUAL_GID;
    u32 mode = 0644;
};

struct MountInfo {
    bool is_local = false;
    std::vector<std::string> tags;
    std::string mount_path;
};

struct Dirent {
    bool is_file = false;
    bool is_directory = false;
    bool is_symbolic_link = false;
    bool is_special = false;
    bool is_executable = false;
    std::string permissions; ///< e.g. "drwxr-xr-x"
    std::string username;
    MountInfo mount;
};

/// One listing record.
struct GlobStats {
    std::string name;
    std::string path; ///< Mount-prefixed
    std::string name_for_display;
    std::string viewer;
    FileStats stats;
    Dirent dirent;
};

/// Result of fstat on a single path.
struct FStat {
    std::string viewer;
    std::string filepath; ///< Mount-relative
    std::string fullpath; ///< Mount-prefixed
    bool is_directory = false;
    bool is_executable = false;
    u64 size = 0;
    std::optional<std::string> data;
};

struct GrepMatch {
    std::string path; ///< Mount-prefixed
    u64 size = 0;
};

/// Virtual filesystem over a trie of entries. Content is never stored;
/// leaves record where it comes from and the backend loads it on demand.
///
/// Single writer: mutations must not run concurrently with other calls.
/// Reads may run concurrently with each other.
class TrieVfs {
public:
    TrieVfs(std::string mount_path, std::unique_ptr<ContentBackend> backend,
            std::vector<std::string> tags = {});
    ~TrieVfs();

    TrieVfs(const TrieVfs&) = delete;
    TrieVfs& operator=(const TrieVfs&) = delete;

    const std::string& mount_path() const { return prefix_.mount_path(); }
    const std::vector<std::string>& tags() const { return tags_; }
    bool is_local() const { return false; }
    bool is_virtual() const { return true; }

    /// True if path lies under this VFS's mount path.
    bool owns(std::string_view path) const { return prefix_.matches(path); }

    const ContentBackend& backend() const { return *backend_; }

    /// Number of entries in the index.
    size_t entry_count() const { return index_.size(); }

    /// Resolve a mount-relative path expression (possibly with globs).
    ///   directory_only: the entry itself (path or path + "/"), not children
    ///   exact:          only entries keyed by exactly this path
    ///   default:        glob matches plus directory contents, minus the
    ///                   queried directory's own entry
    std::vector<Entry> find(std::string_view filepath,
                            bool directory_only = false,
                            bool exact = false) const;

    /// List entries for each path, flattened.
    std::vector<GlobStats> ls(const LsOptions& opts,
                              const std::vector<std::string>& filepaths) const;

    /// Stat a single path. Returns an empty optional instead of a NotFound
    /// error when enoent_ok is set.
    Result<std::optional<FStat>> fstat(std::string_view filepath,
                                       bool with_data, bool enoent_ok) const;

    /// Single-file grep is not supported here; always empty.
    std::vector<GrepMatch> grep(std::string_view pattern,
                                const std::vector<std::string>& filepaths) const;

    /// Leaves under the given paths whose content matches pattern
    /// (ECMAScript regular expression, search semantics).
    Result<std::vector<GrepMatch>> grepdir(
        const std::vector<std::string>& filepaths,
        std::string_view pattern) const;

    /// Record bundled sources as leaves under dst_filepath. No bytes are
    /// copied; the backend loads them on demand.
    Result<void> cp(const std::vector<std::string>& src_filepaths,
                    std::string_view dst_filepath);

    /// Remove the entry keyed by filepath. Absent keys are not an error.
    Result<void> rm(std::string_view filepath);

    /// Insert or overwrite a leaf recording a client notebook reference
    /// derived from the file name. The bytes themselves are not kept.
    Result<void> fwrite(std::string_view filepath, std::string_view data);

    /// Insert a directory entry. Ancestors need not exist.
    Result<void> mkdir(std::string_view filepath);

    /// Same as rm; children are not removed.
    Result<void> rmdir(std::string_view filepath);

    /// Content bytes [offset, offset + length) of a leaf, clamped to the
    /// content. Empty for directories and missing paths.
    Result<std::string> fslice(std::string_view filename, u64 offset,
                               u64 length) const;

private:
    MountPrefix prefix_;
    std::unique_ptr<ContentBackend> backend_;
    std::vector<std::string> tags_;
    TrieIndex index_;

    GlobStats make_stats(const Entry& entry) const;

    /// Root, an entry keyed by dir or dir + "/", or any entry below dir.
    bool directory_exists(std::string_view dir) const;

    /// Replace whatever is stored under the entry's key.
    void put(Entry entry);
};

} // namespace tvfs::vfs
