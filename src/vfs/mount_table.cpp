#include "vfs/mount_table.hpp"
#include "vfs/vfs_error.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace tvfs::vfs {

Error MountTable::no_mount(std::string_view path) {
    return make_error(Errc::NotFound,
                      "No mount for path: " + std::string(path));
}

Result<void> MountTable::mount(std::unique_ptr<TrieVfs> vfs) {
    for (const auto& existing : mounts_) {
        if (existing->mount_path() == vfs->mount_path()) {
            return Error("Mount path already in use: " + vfs->mount_path());
        }
    }
    spdlog::debug("VFS: mounting at '{}'", vfs->mount_path());
    mounts_.push_back(std::move(vfs));
    return {};
}

bool MountTable::unmount(std::string_view mount_path) {
    auto mp = normalize(mount_path);
    auto it = std::find_if(mounts_.begin(), mounts_.end(),
                           [&](const auto& m) { return m->mount_path() == mp; });
    if (it == mounts_.end()) {
        return false;
    }
    mounts_.erase(it);
    return true;
}

TrieVfs* MountTable::find_mount(std::string_view path) const {
    TrieVfs* best = nullptr;
    for (const auto& m : mounts_) {
        if (m->owns(path) &&
            (!best || m->mount_path().size() > best->mount_path().size())) {
            best = m.get();
        }
    }
    return best;
}

std::vector<const TrieVfs*> MountTable::mounts() const {
    std::vector<const TrieVfs*> result;
    result.reserve(mounts_.size());
    for (const auto& m : mounts_) {
        result.push_back(m.get());
    }
    return result;
}

void MountTable::clear() {
    mounts_.clear();
}

std::vector<GlobStats> MountTable::list_mount_roots(std::string_view path) const {
    auto parent = normalize(path);
    std::vector<GlobStats> result;
    for (const auto& m : mounts_) {
        if (m->mount_path() == "/" || dirname(m->mount_path()) != parent) {
            continue;
        }

        GlobStats s;
        s.name = basename(m->mount_path());
        s.path = m->mount_path();
        s.name_for_display = s.name;
        s.viewer = "open";
        s.dirent.is_directory = true;
        s.dirent.permissions = "drw-r--r--";
        s.dirent.mount.is_local = m->is_local();
        s.dirent.mount.tags = m->tags();
        s.dirent.mount.mount_path = m->mount_path();
        result.push_back(std::move(s));
    }
    return result;
}

std::vector<GlobStats> MountTable::ls(
    const LsOptions& opts, const std::vector<std::string>& filepaths) const {
    // Group paths per mount so each mount can fan out its own batch
    std::vector<std::pair<TrieVfs*, std::vector<std::string>>> batches;
    std::vector<GlobStats> result;

    for (const auto& filepath : filepaths) {
        auto* vfs = find_mount(filepath);
        if (!vfs) {
            if (!opts.directory_only) {
                auto roots = list_mount_roots(filepath);
                result.insert(result.end(), roots.begin(), roots.end());
            }
            continue;
        }

        auto it = std::find_if(batches.begin(), batches.end(),
                               [&](const auto& b) { return b.first == vfs; });
        if (it == batches.end()) {
            batches.push_back({vfs, {filepath}});
        } else {
            it->second.push_back(filepath);
        }
    }

    for (const auto& [vfs, paths] : batches) {
        auto stats = vfs->ls(opts, paths);
        result.insert(result.end(), std::make_move_iterator(stats.begin()),
                      std::make_move_iterator(stats.end()));
    }
    return result;
}

Result<std::optional<FStat>> MountTable::fstat(std::string_view filepath,
                                               bool with_data,
                                               bool enoent_ok) const {
    auto* vfs = find_mount(filepath);
    if (!vfs) {
        if (enoent_ok) return std::optional<FStat>{};
        return no_mount(filepath);
    }

    auto result = vfs->fstat(filepath, with_data, true);
    if (!result) {
        return result.error();
    }
    if (result.value()) {
        return result;
    }

    // The mount root always exists, even without an entry of its own
    if (normalize(filepath) == vfs->mount_path()) {
        FStat root;
        root.filepath = "/";
        root.fullpath = vfs->mount_path();
        root.viewer = "open";
        root.is_directory = true;
        return std::optional<FStat>(std::move(root));
    }

    if (enoent_ok) return std::optional<FStat>{};
    return make_error(Errc::NotFound,
                      "File not found: " + std::string(filepath));
}

Result<std::vector<GrepMatch>> MountTable::grepdir(
    const std::vector<std::string>& filepaths, std::string_view pattern) const {
    std::vector<GrepMatch> matches;
    for (const auto& filepath : filepaths) {
        auto* vfs = find_mount(filepath);
        if (!vfs) continue;

        auto result = vfs->grepdir({filepath}, pattern);
        if (!result) {
            return result.error();
        }
        auto found = result.take();
        matches.insert(matches.end(), std::make_move_iterator(found.begin()),
                       std::make_move_iterator(found.end()));
    }
    return matches;
}

Result<void> MountTable::cp(const std::vector<std::string>& src_filepaths,
                            std::string_view dst_filepath) {
    auto* vfs = find_mount(dst_filepath);
    if (!vfs) return no_mount(dst_filepath);
    return vfs->cp(src_filepaths, dst_filepath);
}

Result<void> MountTable::rm(std::string_view filepath) {
    auto* vfs = find_mount(filepath);
    if (!vfs) return no_mount(filepath);
    return vfs->rm(filepath);
}

Result<void> MountTable::fwrite(std::string_view filepath,
                                std::string_view data) {
    auto* vfs = find_mount(filepath);
    if (!vfs) return no_mount(filepath);
    return vfs->fwrite(filepath, data);
}

Result<void> MountTable::mkdir(std::string_view filepath) {
    auto* vfs = find_mount(filepath);
    if (!vfs) return no_mount(filepath);
    return vfs->mkdir(filepath);
}

Result<void> MountTable::rmdir(std::string_view filepath) {
    auto* vfs = find_mount(filepath);
    if (!vfs) return no_mount(filepath);
    return vfs->rmdir(filepath);
}

Result<std::string> MountTable::fslice(std::string_view filepath, u64 offset,
                                       u64 length) const {
    auto* vfs = find_mount(filepath);
    if (!vfs) return std::string();
    return vfs->fslice(filepath, offset, length);
}

} // namespace tvfs::vfs
