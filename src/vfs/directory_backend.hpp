#pragma once

#include "vfs/bundle_backend.hpp"

#include <filesystem>

namespace tvfs::vfs {

/// Bundle backed by a real filesystem directory.
class DirectoryBackend : public BundleBackend {
public:
    explicit DirectoryBackend(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    std::optional<std::vector<char>> read_bundle_file(
        std::string_view relative_path) const override;
    bool bundle_file_exists(std::string_view relative_path) const override;

private:
    std::filesystem::path root_;

    /// Resolve a bundle-relative path to an actual filesystem path.
    std::filesystem::path resolve(std::string_view relative_path) const;
};

} // namespace tvfs::vfs
