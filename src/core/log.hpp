#pragma once

#include <filesystem>
#include <optional>
#include <string_view>
#include <spdlog/spdlog.h>

// Forward declare lua_State to avoid pulling in Lua headers everywhere
struct lua_State;

namespace tvfs::log {

/// Initialize logging with console + file sinks.
/// An empty log_file disables the file sink.
void init(const std::filesystem::path& log_file = "trievfs.log",
          spdlog::level::level_enum level = spdlog::level::info);

/// Flush and shutdown logging.
void shutdown();

/// Level for a name as spdlog spells it ("trace", "debug", "info", "warn",
/// "error", "critical", "off"). nullopt for anything else.
std::optional<spdlog::level::level_enum> parse_level(std::string_view name);

// Lua-side logging functions (C functions registered into Lua)
int l_LOG(lua_State* L);
int l_WARN(lua_State* L);
int l_SPEW(lua_State* L);
int l_ALERT(lua_State* L);

} // namespace tvfs::log
