#pragma once

#include "core/types.hpp"
#include "vfs/bundle_backend.hpp"

#include <filesystem>
#include <mutex>
#include <unordered_map>

namespace tvfs::vfs {

/// Bundle backed by a ZIP archive.
class ZipBackend : public BundleBackend {
public:
    /// Opens the ZIP file and reads its central directory.
    explicit ZipBackend(const std::filesystem::path& archive_path);
    ~ZipBackend() override;

    // Non-copyable
    ZipBackend(const ZipBackend&) = delete;
    ZipBackend& operator=(const ZipBackend&) = delete;

    /// False if the archive could not be opened.
    bool is_open() const { return zip_handle_ != nullptr; }

    /// Number of files indexed from the central directory.
    size_t file_count() const { return entries_.size(); }

    std::optional<std::vector<char>> read_bundle_file(
        std::string_view relative_path) const override;
    bool bundle_file_exists(std::string_view relative_path) const override;

private:
    struct ZipEntryInfo {
        std::string original_name; // as stored in the ZIP
        u64 uncompressed_size = 0;
    };

    std::filesystem::path archive_path_;
    void* zip_handle_ = nullptr; // unzFile from minizip

    // The unzFile cursor is stateful; hooks run on several threads.
    mutable std::mutex zip_mutex_;

    /// Index of all files in the archive, keyed by normalized path.
    std::unordered_map<std::string, ZipEntryInfo> entries_;
};

} // namespace tvfs::vfs
