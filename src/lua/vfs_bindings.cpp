#include "lua/vfs_bindings.hpp"
#include "lua/lua_state.hpp"
#include "core/log.hpp"
#include "vfs/mount_table.hpp"

#include <limits>
#include <string>
#include <vector>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace tvfs::lua {

// Lua raises errors with longjmp, which must not cross live C++ objects.
// Each binding checks its arguments, then calls an *_impl helper that does
// the C++ work and returns the result count, or -1 with the error message
// pushed. The binding raises only after the helper has returned.

static vfs::MountTable* check_mounts(lua_State* L) {
    auto* mounts = LuaState::get_mount_table(L);
    if (!mounts) {
        luaL_error(L, "VFS is not available in this context");
    }
    return mounts;
}

static int push_failure(lua_State* L, const Error& err) {
    lua_pushstring(L, err.message.c_str());
    return -1;
}

static int raise_if_failed(lua_State* L, int nresults) {
    return nresults < 0 ? lua_error(L) : nresults;
}

/// Mkdir(path)
static int mkdir_impl(lua_State* L, vfs::MountTable* mounts, const char* path) {
    auto result = mounts->mkdir(path);
    return result ? 0 : push_failure(L, result.error());
}

static int l_Mkdir(lua_State* L) {
    const char* path = luaL_checkstring(L, 1);
    return raise_if_failed(L, mkdir_impl(L, check_mounts(L), path));
}

/// Rmdir(path)
static int rmdir_impl(lua_State* L, vfs::MountTable* mounts, const char* path) {
    auto result = mounts->rmdir(path);
    return result ? 0 : push_failure(L, result.error());
}

static int l_Rmdir(lua_State* L) {
    const char* path = luaL_checkstring(L, 1);
    return raise_if_failed(L, rmdir_impl(L, check_mounts(L), path));
}

/// Rm(path)
static int rm_impl(lua_State* L, vfs::MountTable* mounts, const char* path) {
    auto result = mounts->rm(path);
    return result ? 0 : push_failure(L, result.error());
}

static int l_Rm(lua_State* L) {
    const char* path = luaL_checkstring(L, 1);
    return raise_if_failed(L, rm_impl(L, check_mounts(L), path));
}

/// Cp(src, dst) or Cp({src1, src2, ...}, dst)
static int cp_impl(lua_State* L, vfs::MountTable* mounts, const char* dst) {
    std::vector<std::string> srcs;
    if (lua_istable(L, 1)) {
        for (int i = 1;; i++) {
            lua_rawgeti(L, 1, i);
            if (lua_isnil(L, -1)) {
                lua_pop(L, 1);
                break;
            }
            if (lua_isstring(L, -1)) {
                srcs.emplace_back(lua_tostring(L, -1));
            }
            lua_pop(L, 1);
        }
    } else {
        srcs.emplace_back(lua_tostring(L, 1));
    }

    auto result = mounts->cp(srcs, dst);
    return result ? 0 : push_failure(L, result.error());
}

static int l_Cp(lua_State* L) {
    if (!lua_istable(L, 1)) {
        luaL_checkstring(L, 1);
    }
    const char* dst = luaL_checkstring(L, 2);
    return raise_if_failed(L, cp_impl(L, check_mounts(L), dst));
}

/// Fwrite(path, data)
static int fwrite_impl(lua_State* L, vfs::MountTable* mounts, const char* path,
                       const char* data, size_t len) {
    auto result = mounts->fwrite(path, std::string_view(data, len));
    return result ? 0 : push_failure(L, result.error());
}

static int l_Fwrite(lua_State* L) {
    const char* path = luaL_checkstring(L, 1);
    size_t len = 0;
    const char* data = luaL_optlstring(L, 2, "", &len);
    return raise_if_failed(L, fwrite_impl(L, check_mounts(L), path, data, len));
}

/// Ls(path [, dashD]) returns an array of mount-prefixed paths.
static int ls_impl(lua_State* L, vfs::MountTable* mounts, const char* path,
                   bool directory_only) {
    vfs::LsOptions opts;
    opts.directory_only = directory_only;
    auto entries = mounts->ls(opts, {path});

    lua_newtable(L);
    int idx = 1;
    for (const auto& entry : entries) {
        lua_pushnumber(L, idx++);
        lua_pushstring(L, entry.path.c_str());
        lua_settable(L, -3);
    }
    return 1;
}

static int l_Ls(lua_State* L) {
    const char* path = luaL_checkstring(L, 1);
    bool directory_only = lua_toboolean(L, 2) != 0;
    return raise_if_failed(L, ls_impl(L, check_mounts(L), path, directory_only));
}

/// Fstat(path [, withData]) returns a table, or nil if the path is absent.
static int fstat_impl(lua_State* L, vfs::MountTable* mounts, const char* path,
                      bool with_data) {
    auto result = mounts->fstat(path, with_data, true);
    if (!result) {
        return push_failure(L, result.error());
    }

    const auto& st = result.value();
    if (!st) {
        lua_pushnil(L);
        return 1;
    }

    lua_newtable(L);
    lua_pushstring(L, "path");
    lua_pushstring(L, st->fullpath.c_str());
    lua_settable(L, -3);
    lua_pushstring(L, "viewer");
    lua_pushstring(L, st->viewer.c_str());
    lua_settable(L, -3);
    lua_pushstring(L, "isDirectory");
    lua_pushboolean(L, st->is_directory ? 1 : 0);
    lua_settable(L, -3);
    if (st->data) {
        lua_pushstring(L, "data");
        lua_pushlstring(L, st->data->data(), st->data->size());
        lua_settable(L, -3);
    }
    return 1;
}

static int l_Fstat(lua_State* L) {
    const char* path = luaL_checkstring(L, 1);
    bool with_data = lua_toboolean(L, 2) != 0;
    return raise_if_failed(L, fstat_impl(L, check_mounts(L), path, with_data));
}

/// Fslice(path, offset, length)
static int fslice_impl(lua_State* L, vfs::MountTable* mounts, const char* path,
                       u64 offset, u64 length) {
    auto result = mounts->fslice(path, offset, length);
    if (!result) {
        return push_failure(L, result.error());
    }
    lua_pushlstring(L, result.value().data(), result.value().size());
    return 1;
}

// Saturates numbers past the u64 range; n must be non-negative.
static u64 to_u64(lua_Number n) {
    constexpr u64 max = std::numeric_limits<u64>::max();
    if (n >= static_cast<lua_Number>(max)) return max;
    return static_cast<u64>(n);
}

static int l_Fslice(lua_State* L) {
    const char* path = luaL_checkstring(L, 1);
    lua_Number offset = luaL_checknumber(L, 2);
    lua_Number length = luaL_checknumber(L, 3);
    if (!(offset >= 0) || !(length >= 0)) {
        return luaL_error(L, "Fslice: offset and length must be non-negative");
    }
    return raise_if_failed(L, fslice_impl(L, check_mounts(L), path,
                                          to_u64(offset),
                                          to_u64(length)));
}

void register_vfs_bindings(LuaState& state) {
    state.register_function("Mkdir", l_Mkdir);
    state.register_function("Rmdir", l_Rmdir);
    state.register_function("Rm", l_Rm);
    state.register_function("Cp", l_Cp);
    state.register_function("Fwrite", l_Fwrite);
    state.register_function("Ls", l_Ls);
    state.register_function("Fstat", l_Fstat);
    state.register_function("Fslice", l_Fslice);
}

void register_log_bindings(LuaState& state) {
    state.register_function("LOG", log::l_LOG);
    state.register_function("WARN", log::l_WARN);
    state.register_function("SPEW", log::l_SPEW);
    state.register_function("_ALERT", log::l_ALERT);
}

} // namespace tvfs::lua
