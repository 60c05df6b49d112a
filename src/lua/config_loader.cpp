#include "lua/config_loader.hpp"
#include "core/log.hpp"
#include "lua/lua_state.hpp"
#include "lua/vfs_bindings.hpp"
#include "vfs/directory_backend.hpp"
#include "vfs/mount_table.hpp"
#include "vfs/zip_backend.hpp"

#include <optional>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace tvfs::lua {

namespace {

/// Read t[key] as a string from the table at an absolute stack index.
std::optional<std::string> string_field(lua_State* L, int index,
                                        const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, index);
    std::optional<std::string> result;
    if (lua_isstring(L, -1)) {
        result = lua_tostring(L, -1);
    }
    lua_pop(L, 1);
    return result;
}

/// Read t[key] as an array of strings; non-string items are skipped.
std::vector<std::string> string_array_field(lua_State* L, int index,
                                            const char* key) {
    std::vector<std::string> result;
    lua_pushstring(L, key);
    lua_gettable(L, index);
    if (lua_istable(L, -1)) {
        for (int i = 1;; i++) {
            lua_rawgeti(L, -1, i);
            if (lua_isnil(L, -1)) {
                lua_pop(L, 1);
                break;
            }
            if (lua_isstring(L, -1)) {
                result.emplace_back(lua_tostring(L, -1));
            }
            lua_pop(L, 1);
        }
    }
    lua_pop(L, 1);
    return result;
}

fs::path resolve_against(const fs::path& base_dir, const std::string& p) {
    fs::path path(p);
    if (path.is_relative() && !base_dir.empty()) {
        path = base_dir / path;
    }
    return path;
}

} // namespace

Result<void> ConfigLoader::execute_config(LuaState& state,
                                          const fs::path& config_file,
                                          vfs::MountTable& mounts) {
    register_log_bindings(state);

    auto config_dir = config_file.parent_path().generic_string();
    state.set_global_string("ConfigFileDir", config_dir.c_str());
    state.set_global_string("ClientVersion", "TrieVFS 0.1.0");

    spdlog::info("Executing config file: {}", config_file.string());

    auto result = state.do_file(config_file);
    if (!result) {
        return result.error().wrap("Failed to execute config file");
    }

    apply_log_level(state.raw());

    auto read = read_mounts_table(state.raw(), config_file.parent_path());
    if (!read) {
        return read;
    }
    return build_mounts(mounts);
}

void ConfigLoader::apply_log_level(lua_State* L) {
    lua_getglobal(L, "log_level");
    if (lua_isstring(L, -1)) {
        std::string name = lua_tostring(L, -1);
        if (auto level = log::parse_level(name)) {
            spdlog::set_level(*level);
            spdlog::debug("Log level set to {} by config", name);
        } else {
            spdlog::warn("Unknown log_level '{}' in config, ignoring", name);
        }
    }
    lua_pop(L, 1);
}

Result<void> ConfigLoader::read_mounts_table(lua_State* L,
                                             const fs::path& base_dir) {
    specs_.clear();

    lua_getglobal(L, "mounts");
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return Error("'mounts' global is not a table after config execution");
    }

    // Iterate the array: mounts[1], mounts[2], ...
    for (int i = 1;; i++) {
        lua_rawgeti(L, -1, i);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            break;
        }

        if (!lua_istable(L, -1)) {
            spdlog::warn("mounts[{}] is not a table, skipping", i);
            lua_pop(L, 1);
            continue;
        }

        int entry = lua_gettop(L);
        auto mountpoint = string_field(L, entry, "mountpoint");
        auto dir = string_field(L, entry, "dir");
        auto archive = string_field(L, entry, "archive");
        auto tags = string_array_field(L, entry, "tags");
        lua_pop(L, 1); // pop entry table

        if (!mountpoint) {
            spdlog::warn("mounts[{}] has no mountpoint, skipping", i);
            continue;
        }
        if (dir.has_value() == archive.has_value()) {
            spdlog::warn("mounts[{}] ({}) needs exactly one of dir or archive, "
                         "skipping", i, *mountpoint);
            continue;
        }

        MountSpec spec;
        spec.mountpoint = *mountpoint;
        if (dir) spec.dir = resolve_against(base_dir, *dir);
        if (archive) spec.archive = resolve_against(base_dir, *archive);
        spec.tags = std::move(tags);
        specs_.push_back(std::move(spec));
    }

    lua_pop(L, 1); // pop mounts table
    return {};
}

Result<void> ConfigLoader::build_mounts(vfs::MountTable& mounts) {
    int count = 0;
    for (const auto& spec : specs_) {
        std::unique_ptr<vfs::ContentBackend> backend;
        std::error_code ec;

        if (!spec.dir.empty()) {
            if (!fs::is_directory(spec.dir, ec)) {
                spdlog::debug("Bundle directory does not exist, skipping: {}",
                              spec.dir.string());
                continue;
            }
            backend = std::make_unique<vfs::DirectoryBackend>(spec.dir);
        } else {
            if (!fs::is_regular_file(spec.archive, ec)) {
                spdlog::debug("Bundle archive does not exist, skipping: {}",
                              spec.archive.string());
                continue;
            }
            auto zip = std::make_unique<vfs::ZipBackend>(spec.archive);
            if (!zip->is_open()) {
                spdlog::warn("Skipping unreadable archive: {}",
                             spec.archive.string());
                continue;
            }
            backend = std::move(zip);
        }

        auto result = mounts.mount(std::make_unique<vfs::TrieVfs>(
            spec.mountpoint, std::move(backend), spec.tags));
        if (!result) {
            return result;
        }
        count++;
    }

    spdlog::info("VFS: {} mount points active", count);
    return {};
}

Result<void> ConfigLoader::run_seed(LuaState& state, vfs::MountTable& mounts) {
    if (!state.has_function("Seed")) {
        return {};
    }

    state.set_mount_table(&mounts);
    register_vfs_bindings(state);

    // Call Seed() from a Lua chunk (not directly from C)
    auto result = state.do_string("Seed()");
    if (!result) {
        return result.error().wrap("Seed failed");
    }
    spdlog::debug("Seed complete");
    return {};
}

} // namespace tvfs::lua
