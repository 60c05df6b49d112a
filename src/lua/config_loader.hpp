#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

extern "C" {
struct lua_State;
}

namespace tvfs::vfs {
class MountTable;
}

namespace tvfs::lua {

class LuaState;

/// One entry of the config script's `mounts` table.
struct MountSpec {
    std::string mountpoint;
    fs::path dir;     ///< Directory bundle, empty if unused
    fs::path archive; ///< ZIP bundle, empty if unused
    std::vector<std::string> tags;
};

/// Orchestrates configuration:
/// Phase 1: Execute the config script and mount the bundles it declares.
/// Phase 2: Run the script's Seed() function against the mounted VFS.
class ConfigLoader {
public:
    /// Phase 1: Execute the config file and build the mount table.
    Result<void> execute_config(LuaState& state, const fs::path& config_file,
                                vfs::MountTable& mounts);

    /// Phase 2: Call Seed() if the config defines it.
    Result<void> run_seed(LuaState& state, vfs::MountTable& mounts);

    /// Mount specs read by the last execute_config call.
    const std::vector<MountSpec>& specs() const { return specs_; }

private:
    std::vector<MountSpec> specs_;

    /// Apply the optional `log_level` global to the default logger.
    static void apply_log_level(lua_State* L);

    /// Parse the mounts table from Lua state into MountSpecs.
    Result<void> read_mounts_table(lua_State* L, const fs::path& base_dir);

    /// Create a backend per spec and mount it.
    Result<void> build_mounts(vfs::MountTable& mounts);
};

} // namespace tvfs::lua
