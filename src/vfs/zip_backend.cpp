#include "vfs/zip_backend.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <minizip/unzip.h>

namespace tvfs::vfs {

ZipBackend::ZipBackend(const std::filesystem::path& archive_path)
    : archive_path_(archive_path) {
    zip_handle_ = unzOpen(archive_path.string().c_str());
    if (!zip_handle_) {
        spdlog::error("Failed to open ZIP archive: {}", archive_path.string());
        return;
    }

    // Read central directory
    int ret = unzGoToFirstFile(static_cast<unzFile>(zip_handle_));
    while (ret == UNZ_OK) {
        unz_file_info file_info;
        char filename[512];
        if (unzGetCurrentFileInfo(static_cast<unzFile>(zip_handle_), &file_info,
                                  filename, sizeof(filename), nullptr, 0,
                                  nullptr, 0) != UNZ_OK) {
            spdlog::warn("Unreadable entry in {}", archive_path.string());
            ret = unzGoToNextFile(static_cast<unzFile>(zip_handle_));
            continue;
        }

        std::string name(filename);
        std::replace(name.begin(), name.end(), '\\', '/');
        // Skip directories (entries ending with /)
        if (!name.empty() && name.back() != '/') {
            ZipEntryInfo entry;
            entry.original_name = filename;
            entry.uncompressed_size = file_info.uncompressed_size;
            entries_[bundle_key(name)] = std::move(entry);
        }

        ret = unzGoToNextFile(static_cast<unzFile>(zip_handle_));
    }

    spdlog::debug("ZIP bundle {}: {} files indexed",
                  archive_path.filename().string(), entries_.size());
}

ZipBackend::~ZipBackend() {
    if (zip_handle_) {
        unzClose(static_cast<unzFile>(zip_handle_));
    }
}

std::optional<std::vector<char>> ZipBackend::read_bundle_file(
    std::string_view relative_path) const {
    if (!zip_handle_) return std::nullopt;

    auto it = entries_.find(bundle_key(relative_path));
    if (it == entries_.end()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(zip_mutex_);
    auto zf = static_cast<unzFile>(zip_handle_);

    // Locate file in the ZIP by its original name (case-sensitive)
    if (unzLocateFile(zf, it->second.original_name.c_str(), 1) != UNZ_OK) {
        return std::nullopt;
    }

    if (unzOpenCurrentFile(zf) != UNZ_OK) {
        return std::nullopt;
    }

    std::vector<char> buffer(it->second.uncompressed_size);
    int bytes_read = 0;
    if (!buffer.empty()) {
        bytes_read = unzReadCurrentFile(zf, buffer.data(),
                                        static_cast<unsigned>(buffer.size()));
    }
    unzCloseCurrentFile(zf);

    if (bytes_read < 0 ||
        static_cast<u64>(bytes_read) != it->second.uncompressed_size) {
        spdlog::warn("Failed to inflate {} from {}", it->second.original_name,
                     archive_path_.filename().string());
        return std::nullopt;
    }

    return buffer;
}

bool ZipBackend::bundle_file_exists(std::string_view relative_path) const {
    return entries_.contains(bundle_key(relative_path));
}

} // namespace tvfs::vfs
