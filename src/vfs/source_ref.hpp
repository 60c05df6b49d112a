#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tvfs::vfs {

/// A recognized reference to backend-bundled content.
///   plugin://plugin-<plugin>/notebooks/<file>.(md|json)
///   plugin://client/notebooks/<file>.(md|json|yml|yaml|txt|py)
///   plugin://client/<file>.(md|json)
struct SourceRef {
    std::string src_filepath; ///< The full reference as given
    std::string plugin;       ///< Plugin name, empty for client content
    std::string file;         ///< File stem, may contain '/'
    std::string extension;    ///< Without the dot

    /// File name the content takes when copied into a directory.
    std::string filename() const { return file + "." + extension; }

    /// Path of the content relative to a bundle root, e.g.
    /// "client/notebooks/readme.md" or "plugin-foo/notebooks/intro.json".
    std::string bundle_path() const;
};

/// Parse a source reference. Returns nullopt for unrecognized shapes.
std::optional<SourceRef> parse_source_ref(std::string_view src_filepath);

/// The client notebook reference that fwrite records for a file name.
std::string client_notebook_source(std::string_view stem,
                                   std::string_view extension);

} // namespace tvfs::vfs
