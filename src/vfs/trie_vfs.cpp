#include "vfs/trie_vfs.hpp"
#include "vfs/glob.hpp"
#include "vfs/source_ref.hpp"
#include "vfs/vfs_error.hpp"

#include <algorithm>
#include <future>
#include <regex>
#include <spdlog/spdlog.h>
#include <system_error>
#include <thread>
#include <type_traits>

namespace tvfs::vfs {

namespace {

// std::async throws when no thread can be started; run inline instead.
template <typename F>
std::future<std::invoke_result_t<std::decay_t<F>>> start_task(std::launch policy,
                                                               F&& fn) {
    if (policy == std::launch::async) {
        try {
            return std::async(std::launch::async, fn);
        } catch (const std::system_error& e) {
            spdlog::warn("Unable to start worker thread, running inline: {}",
                         e.what());
        }
    }
    return std::async(std::launch::deferred, std::forward<F>(fn));
}

} // namespace

TrieVfs::TrieVfs(std::string mount_path,
                 std::unique_ptr<ContentBackend> backend,
                 std::vector<std::string> tags)
    : prefix_(std::move(mount_path)),
      backend_(std::move(backend)),
      tags_(std::move(tags)) {}

TrieVfs::~TrieVfs() = default;

std::vector<Entry> TrieVfs::find(std::string_view filepath,
                                 bool directory_only, bool exact) const {
    // Trim off trailing globby bits when looking up in the trie; the
    // candidate set is bounded by the literal prefix. No candidates means
    // no match, even for shapes a full scan might have found.
    auto candidates = index_.get(strip_glob_suffix(filepath));

    std::vector<Entry> result;
    if (directory_only) {
        std::string with_slash = std::string(filepath) + "/";
        for (auto& entry : candidates) {
            const auto& path = entry_path(entry);
            if (path == filepath || path == with_slash) {
                result.push_back(std::move(entry));
            }
        }
        return result;
    }

    if (exact) {
        for (auto& entry : candidates) {
            if (entry_path(entry) == filepath) {
                result.push_back(std::move(entry));
            }
        }
        return result;
    }

    bool globbed = has_glob(filepath);
    auto dir_pattern = directory_pattern(filepath);
    for (auto& entry : candidates) {
        const auto& path = entry_path(entry);
        bool hit = globbed ? glob_match(filepath, path) : path == filepath;
        if (!hit && !std::regex_match(path, dir_pattern)) {
            continue;
        }
        // A directory is not one of its own children
        if (is_directory(entry) && path == filepath) {
            continue;
        }
        result.push_back(std::move(entry));
    }
    return result;
}

GlobStats TrieVfs::make_stats(const Entry& entry) const {
    const auto& path = entry_path(entry);
    const auto* leaf = std::get_if<Leaf>(&entry);
    bool dir = !leaf && is_directory(entry);
    bool exec = is_executable(entry);

    GlobStats s;
    s.name = basename(path);
    s.path = prefix_.apply(path);
    s.name_for_display = backend_->name_for_display(s.name, entry);
    s.viewer = leaf ? backend_->viewer(*leaf) : "open";

    s.stats.mode = exec ? 0755 : 0644;

    s.dirent.is_file = !dir;
    s.dirent.is_directory = dir;
    s.dirent.is_executable = exec;
    s.dirent.permissions =
        std::string(dir ? "d" : "-") + (exec ? "rwxr-xr-x" : "rw-r--r--");
    s.dirent.mount.is_local = is_local();
    s.dirent.mount.tags = tags_;
    s.dirent.mount.mount_path = mount_path();
    return s;
}

std::vector<GlobStats> TrieVfs::ls(
    const LsOptions& opts, const std::vector<std::string>& filepaths) const {
    // Each path resolves independently; display names may be slow to
    // derive, so several paths are listed on worker threads.
    auto policy = filepaths.size() > 1 ? std::launch::async
                                       : std::launch::deferred;

    std::vector<std::future<std::vector<GlobStats>>> pending;
    pending.reserve(filepaths.size());
    for (const auto& filepath : filepaths) {
        pending.push_back(start_task(policy, [this, &opts, &filepath] {
            std::vector<GlobStats> stats;
            for (const auto& entry :
                 find(prefix_.strip(filepath), opts.directory_only)) {
                stats.push_back(make_stats(entry));
            }
            return stats;
        }));
    }

    std::vector<GlobStats> result;
    for (auto& f : pending) {
        auto stats = f.get();
        result.insert(result.end(), std::make_move_iterator(stats.begin()),
                      std::make_move_iterator(stats.end()));
    }
    return result;
}

Result<std::optional<FStat>> TrieVfs::fstat(std::string_view filepath,
                                            bool with_data,
                                            bool enoent_ok) const {
    auto matches = find(prefix_.strip(filepath), false, true);
    if (matches.empty()) {
        if (enoent_ok) {
            return std::optional<FStat>{};
        }
        return make_error(Errc::NotFound,
                          "File not found: " + std::string(filepath));
    }

    const auto& entry = matches.front();
    const auto* leaf = std::get_if<Leaf>(&entry);

    FStat st;
    st.viewer = leaf ? backend_->viewer(*leaf) : "open";
    st.filepath = entry_path(entry);
    st.fullpath = prefix_.apply(st.filepath);
    st.is_directory = !leaf && is_directory(entry);
    st.is_executable = is_executable(entry);

    if (with_data && leaf) {
        auto content = backend_->load_as_string(*leaf);
        if (!content) {
            return content.error().wrap(st.fullpath);
        }
        st.data = content.take();
    }

    return std::optional<FStat>(std::move(st));
}

std::vector<GrepMatch> TrieVfs::grep(
    std::string_view /*pattern*/,
    const std::vector<std::string>& /*filepaths*/) const {
    return {};
}

Result<std::vector<GrepMatch>> TrieVfs::grepdir(
    const std::vector<std::string>& filepaths,
    std::string_view pattern) const {
    std::regex re;
    try {
        re = std::regex(std::string(pattern));
    } catch (const std::regex_error& e) {
        return make_error(Errc::InvalidPattern,
                          "Invalid pattern '" + std::string(pattern) +
                              "': " + e.what());
    }

    std::vector<Leaf> leaves;
    for (const auto& filepath : filepaths) {
        for (auto& entry : find(prefix_.strip(filepath))) {
            if (auto* leaf = std::get_if<Leaf>(&entry)) {
                leaves.push_back(std::move(*leaf));
            }
        }
    }

    // Content loads are independent. Split them over at most one worker
    // per hardware thread; each worker takes every n-th leaf.
    size_t workers = std::max(1u, std::thread::hardware_concurrency());
    workers = std::min(workers, leaves.size());
    std::vector<char> hits(leaves.size(), 0);

    std::vector<std::future<void>> pending;
    pending.reserve(workers);
    for (size_t w = 0; w < workers; w++) {
        pending.push_back(start_task(std::launch::async,
                                     [this, &leaves, &hits, &re, w, workers] {
            for (size_t i = w; i < leaves.size(); i += workers) {
                const auto& leaf = leaves[i];
                auto content = backend_->load_as_string(leaf);
                if (!content) {
                    spdlog::warn("grep: skipping {}: {}",
                                 prefix_.apply(leaf.mount_path),
                                 content.error().message);
                    continue;
                }
                hits[i] = std::regex_search(content.value(), re) ? 1 : 0;
            }
        }));
    }
    for (auto& f : pending) {
        f.get();
    }

    std::vector<GrepMatch> matches;
    for (size_t i = 0; i < leaves.size(); i++) {
        if (hits[i]) {
            GrepMatch m;
            m.path = prefix_.apply(leaves[i].mount_path);
            matches.push_back(std::move(m));
        }
    }
    return matches;
}

bool TrieVfs::directory_exists(std::string_view dir) const {
    std::string key(dir);
    while (key.size() > 1 && key.back() == '/') {
        key.pop_back();
    }
    if (key == "/") return true;

    // Anything below the directory makes it exist implicitly
    if (index_.has_prefix(key + "/")) return true;

    for (const auto& entry : index_.get(key)) {
        if (!is_leaf(entry) && entry_path(entry) == key) return true;
    }
    return false;
}

void TrieVfs::put(Entry entry) {
    std::string key = entry_path(entry);
    index_.remove(key);
    index_.insert(key, std::move(entry));
}

Result<void> TrieVfs::cp(const std::vector<std::string>& src_filepaths,
                         std::string_view dst_filepath) {
    // Validate everything before touching the index
    std::vector<SourceRef> refs;
    refs.reserve(src_filepaths.size());
    for (const auto& src : src_filepaths) {
        auto ref = parse_source_ref(src);
        if (!ref) {
            spdlog::warn("cp: unsupported source {}", src);
            return make_error(Errc::InvalidSource,
                              "Unable to copy given source into the VFS: " + src);
        }
        refs.push_back(std::move(*ref));
    }

    auto target = prefix_.strip(dst_filepath);

    std::vector<Leaf> leaves;
    if (directory_exists(target)) {
        for (const auto& ref : refs) {
            Leaf leaf;
            leaf.mount_path = join(target, ref.filename());
            leaf.data.src_filepath = ref.src_filepath;
            leaves.push_back(std::move(leaf));
        }
    } else {
        if (refs.size() > 1 || target.back() == '/') {
            return make_error(Errc::MissingDirectory,
                              "Directory does not exist: " +
                                  std::string(dst_filepath));
        }
        auto dir = dirname(target);
        if (!directory_exists(dir)) {
            return make_error(Errc::MissingDirectory,
                              "Directory does not exist: " + prefix_.apply(dir));
        }
        if (!refs.empty()) {
            Leaf leaf;
            leaf.mount_path = target;
            leaf.data.src_filepath = refs.front().src_filepath;
            leaves.push_back(std::move(leaf));
        }
    }

    for (auto& leaf : leaves) {
        spdlog::debug("cp: {} -> {}", leaf.data.src_filepath,
                      prefix_.apply(leaf.mount_path));
        put(std::move(leaf));
    }
    return {};
}

Result<void> TrieVfs::rm(std::string_view filepath) {
    auto key = prefix_.strip(filepath);
    size_t removed = index_.remove(key);
    spdlog::debug("rm: {} ({} entries)", prefix_.apply(key), removed);
    return {};
}

Result<void> TrieVfs::fwrite(std::string_view filepath, std::string_view data) {
    auto relative = prefix_.strip(filepath);
    auto ext = extension(relative);
    if (ext.empty()) {
        return make_error(Errc::InvalidFilename,
                          "Invalid filepath for writing to VFS: " +
                              std::string(filepath));
    }

    auto name = basename(relative);
    auto stem = name.substr(0, name.size() - ext.size() - 1);

    Leaf leaf;
    leaf.mount_path = relative;
    leaf.data.src_filepath = client_notebook_source(stem, ext);

    spdlog::debug("fwrite: {} ({} bytes) recorded as {}", prefix_.apply(relative),
                  data.size(), leaf.data.src_filepath);
    put(std::move(leaf));
    return {};
}

Result<void> TrieVfs::mkdir(std::string_view filepath) {
    Directory dir;
    dir.mount_path = prefix_.strip(filepath);
    spdlog::debug("mkdir: {}", prefix_.apply(dir.mount_path));
    put(std::move(dir));
    return {};
}

Result<void> TrieVfs::rmdir(std::string_view filepath) {
    return rm(filepath);
}

Result<std::string> TrieVfs::fslice(std::string_view filename, u64 offset,
                                    u64 length) const {
    auto matches = find(prefix_.strip(filename), false, true);
    if (matches.empty()) {
        return std::string();
    }

    const auto* leaf = std::get_if<Leaf>(&matches.front());
    if (!leaf) {
        return std::string();
    }

    auto content = backend_->load_as_string(*leaf);
    if (!content) {
        return content.error().wrap(prefix_.apply(leaf->mount_path));
    }

    const auto& text = content.value();
    if (offset >= text.size()) {
        return std::string();
    }
    return text.substr(offset, length);
}

} // namespace tvfs::vfs
