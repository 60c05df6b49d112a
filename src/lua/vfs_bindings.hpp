#pragma once

struct lua_State;

namespace tvfs::lua {

class LuaState;

/// Register the script-side VFS functions (Mkdir, Rmdir, Rm, Cp, Fwrite,
/// Ls, Fstat, Fslice). They operate on the mount table stored with
/// LuaState::set_mount_table.
void register_vfs_bindings(LuaState& state);

/// Register LOG, WARN, SPEW and _ALERT.
void register_log_bindings(LuaState& state);

} // namespace tvfs::lua
