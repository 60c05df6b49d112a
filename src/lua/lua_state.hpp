#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

struct lua_State;

namespace tvfs::vfs {
class MountTable;
}

namespace tvfs::lua {

/// Registry key for the mount table pointer used by the C bindings.
constexpr const char* REG_MOUNT_TABLE = "tvfs_mount_table";

/// RAII wrapper around a Lua state.
class LuaState {
public:
    LuaState();
    ~LuaState();

    // Move-only
    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;
    LuaState(LuaState&& other) noexcept;
    LuaState& operator=(LuaState&& other) noexcept;

    lua_State* raw() const { return L_; }

    /// Register a C function as a global.
    void register_function(const char* name, int (*fn)(lua_State*));

    /// Set a global string variable.
    void set_global_string(const char* name, const char* value);

    /// True if the named global is a function.
    bool has_function(const char* name) const;

    /// Execute a string of Lua code.
    Result<void> do_string(std::string_view code);

    /// Execute a file from the real filesystem.
    Result<void> do_file(const fs::path& path);

    /// Execute a buffer with a given chunk name.
    Result<void> do_buffer(const char* buf, size_t len, const char* name);

    /// Store a MountTable pointer in the Lua registry for access from C bindings.
    void set_mount_table(vfs::MountTable* mounts);

    /// Retrieve the MountTable pointer from a lua_State (static, for use in C bindings).
    static vfs::MountTable* get_mount_table(lua_State* L);

private:
    lua_State* L_ = nullptr;
};

} // namespace tvfs::lua
