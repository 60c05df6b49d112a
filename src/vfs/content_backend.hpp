#pragma once

#include "core/result.hpp"
#include "vfs/entry.hpp"

#include <string>
#include <string_view>

namespace tvfs::vfs {

/// Abstract content source behind a TrieVfs (bundled notebooks,
/// generated documents, ...). The VFS only ever reaches backend state
/// through these hooks.
///
/// Hooks are const and may be called concurrently from worker threads
/// during batch operations (ls, grepdir).
class ContentBackend {
public:
    virtual ~ContentBackend() = default;

    /// Load a leaf's content as text.
    virtual Result<std::string> load_as_string(const Leaf& leaf) const = 0;

    /// Human-facing name for an entry. Defaults to the raw name.
    virtual std::string name_for_display(std::string_view name,
                                         const Entry& /*entry*/) const {
        return std::string(name);
    }

    /// Viewer tag used to open a leaf. Defaults to "open".
    virtual std::string viewer(const Leaf& /*leaf*/) const { return "open"; }
};

} // namespace tvfs::vfs
