#pragma once

#include "vfs/content_backend.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tvfs::vfs {

/// Title of a Markdown document: the front-matter "title:" field, else
/// the first "# " heading. nullopt if neither is present.
std::optional<std::string> markdown_title(std::string_view content);

/// Backend for plugin-bundled content. A leaf's source reference
/// ("plugin://client/notebooks/readme.md") maps to a path inside the
/// bundle ("client/notebooks/readme.md"); subclasses read that path.
class BundleBackend : public ContentBackend {
public:
    Result<std::string> load_as_string(const Leaf& leaf) const override;

    /// Markdown leaves display their title; everything else its name.
    std::string name_for_display(std::string_view name,
                                 const Entry& entry) const override;

    /// JSON notebooks open in the replay viewer.
    std::string viewer(const Leaf& leaf) const override;

    /// Read a file given its bundle-relative path. Returns nullopt if not found.
    virtual std::optional<std::vector<char>> read_bundle_file(
        std::string_view relative_path) const = 0;

    /// Check if a file exists at the given bundle-relative path.
    virtual bool bundle_file_exists(std::string_view relative_path) const = 0;

protected:
    /// Collapse . and .. and strip the leading slash, so a bundle path
    /// can never point outside the bundle root.
    static std::string bundle_key(std::string_view relative_path);
};

} // namespace tvfs::vfs
