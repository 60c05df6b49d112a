#pragma once

#include "vfs/trie_vfs.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tvfs::vfs {

/// Registry of TrieVfs instances keyed by mount path. Each caller path is
/// routed to the mount with the longest matching mount path.
class MountTable {
public:
    /// Add a mount. Fails if the mount path is already taken.
    Result<void> mount(std::unique_ptr<TrieVfs> vfs);

    /// Remove the mount at exactly this mount path.
    bool unmount(std::string_view mount_path);

    /// The mount responsible for a path, or nullptr.
    TrieVfs* find_mount(std::string_view path) const;

    /// Number of active mounts.
    size_t mount_count() const { return mounts_.size(); }

    /// Mounts in mount order.
    std::vector<const TrieVfs*> mounts() const;

    /// Clear all mounts.
    void clear();

    std::vector<GlobStats> ls(const LsOptions& opts,
                              const std::vector<std::string>& filepaths) const;
    Result<std::optional<FStat>> fstat(std::string_view filepath,
                                       bool with_data, bool enoent_ok) const;
    Result<std::vector<GrepMatch>> grepdir(
        const std::vector<std::string>& filepaths,
        std::string_view pattern) const;
    Result<void> cp(const std::vector<std::string>& src_filepaths,
                    std::string_view dst_filepath);
    Result<void> rm(std::string_view filepath);
    Result<void> fwrite(std::string_view filepath, std::string_view data);
    Result<void> mkdir(std::string_view filepath);
    Result<void> rmdir(std::string_view filepath);
    Result<std::string> fslice(std::string_view filepath, u64 offset,
                               u64 length) const;

private:
    std::vector<std::unique_ptr<TrieVfs>> mounts_;

    /// Mount roots exactly one segment below path, as directory records.
    std::vector<GlobStats> list_mount_roots(std::string_view path) const;

    static Error no_mount(std::string_view path);
};

} // namespace tvfs::vfs
