#include "vfs/bundle_backend.hpp"
#include "vfs/path_utils.hpp"
#include "vfs/source_ref.hpp"
#include "vfs/vfs_error.hpp"

#include <spdlog/spdlog.h>

namespace tvfs::vfs {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() &&
           (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

std::string_view unquote(std::string_view s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') &&
        s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

} // namespace

std::optional<std::string> markdown_title(std::string_view content) {
    size_t pos = 0;
    bool in_front_matter = false;
    bool first_line = true;

    while (pos < content.size()) {
        auto eol = content.find('\n', pos);
        if (eol == std::string_view::npos) eol = content.size();
        auto line = trim(content.substr(pos, eol - pos));
        pos = eol + 1;

        if (first_line && line == "---") {
            in_front_matter = true;
            first_line = false;
            continue;
        }
        first_line = false;

        if (in_front_matter) {
            if (line == "---") {
                in_front_matter = false;
            } else if (line.substr(0, 6) == "title:") {
                auto title = unquote(trim(line.substr(6)));
                if (!title.empty()) return std::string(title);
            }
            continue;
        }

        if (line.size() > 2 && line.substr(0, 2) == "# ") {
            return std::string(trim(line.substr(2)));
        }
    }
    return std::nullopt;
}

std::string BundleBackend::bundle_key(std::string_view relative_path) {
    auto key = normalize("/" + std::string(relative_path));
    return key.substr(1);
}

Result<std::string> BundleBackend::load_as_string(const Leaf& leaf) const {
    auto ref = parse_source_ref(leaf.data.src_filepath);
    if (!ref) {
        return make_error(Errc::LoadFailed,
                          "Unrecognized source: " + leaf.data.src_filepath);
    }

    auto data = read_bundle_file(ref->bundle_path());
    if (!data) {
        return make_error(Errc::LoadFailed,
                          "Source not found in bundle: " + leaf.data.src_filepath);
    }
    return std::string(data->begin(), data->end());
}

std::string BundleBackend::name_for_display(std::string_view name,
                                            const Entry& entry) const {
    const auto* leaf = std::get_if<Leaf>(&entry);
    if (!leaf || extension(name) != "md") {
        return std::string(name);
    }

    auto content = load_as_string(*leaf);
    if (!content) {
        spdlog::debug("No display title for {}: {}", name,
                      content.error().message);
        return std::string(name);
    }

    auto title = markdown_title(content.value());
    return title ? *title : std::string(name);
}

std::string BundleBackend::viewer(const Leaf& leaf) const {
    return extension(leaf.data.src_filepath) == "json" ? "replay" : "open";
}

} // namespace tvfs::vfs
