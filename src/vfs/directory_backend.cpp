#include "vfs/directory_backend.hpp"

#include <fstream>
#include <spdlog/spdlog.h>

namespace tvfs::vfs {

DirectoryBackend::DirectoryBackend(std::filesystem::path root)
    : root_(std::move(root)) {
    spdlog::debug("Directory bundle at {}", root_.string());
}

std::filesystem::path DirectoryBackend::resolve(
    std::string_view relative_path) const {
    return root_ / std::filesystem::path(bundle_key(relative_path));
}

std::optional<std::vector<char>> DirectoryBackend::read_bundle_file(
    std::string_view relative_path) const {
    auto full_path = resolve(relative_path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(full_path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(full_path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return std::nullopt;
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<char> buffer(static_cast<size_t>(size));
    if (!file.read(buffer.data(), size)) {
        spdlog::warn("Short read from {}", full_path.string());
        return std::nullopt;
    }

    return buffer;
}

bool DirectoryBackend::bundle_file_exists(std::string_view relative_path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(resolve(relative_path), ec);
}

} // namespace tvfs::vfs
