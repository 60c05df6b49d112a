#include <catch2/catch_test_macros.hpp>
#include "lua/config_loader.hpp"
#include "lua/lua_state.hpp"
#include "temp_dir.hpp"
#include "vfs/mount_table.hpp"

#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
}

using namespace tvfs;
using namespace tvfs::lua;

namespace {

double global_number(LuaState& state, const char* name) {
    lua_getglobal(state.raw(), name);
    double v = lua_tonumber(state.raw(), -1);
    lua_pop(state.raw(), 1);
    return v;
}

std::string global_string(LuaState& state, const char* name) {
    lua_getglobal(state.raw(), name);
    std::string v = lua_isstring(state.raw(), -1) ? lua_tostring(state.raw(), -1) : "";
    lua_pop(state.raw(), 1);
    return v;
}

} // namespace

TEST_CASE("Config mounts directory bundles", "[config]") {
    test::TempDir dir;
    dir.write("bundle/client/notebooks/readme.md", "# Read Me\n");
    auto config = dir.write("trievfs.lua", R"(
        mounts = {
            { mountpoint = "/kui", dir = "bundle", tags = { "docs", "local" } },
            { mountpoint = "/gone", dir = "no-such-dir" },
            { mountpoint = "/both", dir = "bundle", archive = "x.zip" },
            { dir = "bundle" },
            "not a table",
        }
        seen_dir = ConfigFileDir
        seen_version = ClientVersion
    )");

    LuaState state;
    vfs::MountTable mounts;
    ConfigLoader loader;
    REQUIRE(loader.execute_config(state, config, mounts).ok());

    REQUIRE(loader.specs().size() == 2);
    CHECK(loader.specs()[0].mountpoint == "/kui");
    CHECK(loader.specs()[0].dir == dir.path() / "bundle");
    CHECK(loader.specs()[0].tags == std::vector<std::string>{"docs", "local"});

    // Missing sources are skipped
    REQUIRE(mounts.mount_count() == 1);
    auto* kui = mounts.find_mount("/kui");
    REQUIRE(kui != nullptr);
    CHECK(kui->tags() == std::vector<std::string>{"docs", "local"});

    CHECK(global_string(state, "seen_dir") == dir.path().generic_string());
    CHECK(global_string(state, "seen_version") == "TrieVFS 0.1.0");
}

TEST_CASE("Config errors", "[config]") {
    test::TempDir dir;
    LuaState state;
    vfs::MountTable mounts;
    ConfigLoader loader;

    SECTION("missing file") {
        CHECK_FALSE(loader.execute_config(state, dir.path() / "none.lua", mounts).ok());
    }

    SECTION("script error") {
        auto config = dir.write("bad.lua", "mounts = {");
        CHECK_FALSE(loader.execute_config(state, config, mounts).ok());
    }

    SECTION("no mounts table") {
        auto config = dir.write("empty.lua", "x = 1");
        auto r = loader.execute_config(state, config, mounts);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().message.find("mounts") != std::string::npos);
    }

    SECTION("duplicate mount points") {
        dir.write("bundle/client/welcome.md", "hi");
        auto config = dir.write("dup.lua", R"(
            mounts = {
                { mountpoint = "/kui", dir = "bundle" },
                { mountpoint = "/kui/", dir = "bundle" },
            }
        )");
        CHECK_FALSE(loader.execute_config(state, config, mounts).ok());
    }
}

TEST_CASE("Seed populates the mounted VFS", "[config]") {
    test::TempDir dir;
    dir.write("bundle/client/notebooks/readme.md", "# Read Me\nhello\n");
    dir.write("bundle/plugin-kubectl/notebooks/intro.json", "{}");
    auto config = dir.write("trievfs.lua", R"(
        mounts = {
            { mountpoint = "/kui", dir = "bundle" },
        }

        function Seed()
            Mkdir("/kui/docs")
            Cp("plugin://client/notebooks/readme.md", "/kui/docs")
            Cp({ "plugin://plugin-kubectl/notebooks/intro.json" }, "/kui/docs")
            Fwrite("/kui/docs/todo.md", "ignored")

            listed = 0
            for _, p in ipairs(Ls("/kui/docs")) do
                listed = listed + 1
            end

            local st = Fstat("/kui/docs/readme.md", true)
            readme_data = st.data
            readme_dir = st.isDirectory
            missing_is_nil = (Fstat("/kui/docs/none.md") == nil)
            slice = Fslice("/kui/docs/readme.md", 2, 4)
            far_slice = Fslice("/kui/docs/readme.md", 1e30, 1)
            long_slice = Fslice("/kui/docs/readme.md", 0, 1e30)
            negative_ok = pcall(Fslice, "/kui/docs/readme.md", -1, 1)

            Rm("/kui/docs/todo.md")
            LOG("seeded ", listed, " entries")
        end
    )");

    LuaState state;
    vfs::MountTable mounts;
    ConfigLoader loader;
    REQUIRE(loader.execute_config(state, config, mounts).ok());
    REQUIRE(loader.run_seed(state, mounts).ok());

    CHECK(global_number(state, "listed") == 3);
    CHECK(global_string(state, "readme_data") == "# Read Me\nhello\n");
    CHECK(global_string(state, "slice") == "Read");
    CHECK(global_string(state, "far_slice").empty());
    CHECK(global_string(state, "long_slice") == "# Read Me\nhello\n");

    lua_getglobal(state.raw(), "readme_dir");
    CHECK(lua_toboolean(state.raw(), -1) == 0);
    lua_pop(state.raw(), 1);
    lua_getglobal(state.raw(), "missing_is_nil");
    CHECK(lua_toboolean(state.raw(), -1) == 1);
    lua_pop(state.raw(), 1);
    lua_getglobal(state.raw(), "negative_ok");
    CHECK(lua_toboolean(state.raw(), -1) == 0);
    lua_pop(state.raw(), 1);

    auto listing = mounts.ls({}, {"/kui/docs"});
    CHECK(listing.size() == 2);
}

TEST_CASE("Seed errors propagate", "[config]") {
    test::TempDir dir;
    dir.write("bundle/client/welcome.md", "hi");
    auto config = dir.write("trievfs.lua", R"(
        mounts = { { mountpoint = "/kui", dir = "bundle" } }
        function Seed()
            Cp("/etc/passwd", "/kui")
        end
    )");

    LuaState state;
    vfs::MountTable mounts;
    ConfigLoader loader;
    REQUIRE(loader.execute_config(state, config, mounts).ok());

    auto r = loader.run_seed(state, mounts);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().message.find("Unable to copy") != std::string::npos);
}

TEST_CASE("Config sets the log level", "[config]") {
    test::TempDir dir;
    auto config = dir.write("trievfs.lua", "log_level = 'error'\nmounts = {}");

    auto previous = spdlog::default_logger()->level();
    LuaState state;
    vfs::MountTable mounts;
    ConfigLoader loader;
    REQUIRE(loader.execute_config(state, config, mounts).ok());
    CHECK(spdlog::default_logger()->level() == spdlog::level::err);
    spdlog::set_level(previous);
}

TEST_CASE("Config without Seed", "[config]") {
    test::TempDir dir;
    auto config = dir.write("trievfs.lua", "mounts = {}");

    LuaState state;
    vfs::MountTable mounts;
    ConfigLoader loader;
    REQUIRE(loader.execute_config(state, config, mounts).ok());
    CHECK(loader.run_seed(state, mounts).ok());
    CHECK(mounts.mount_count() == 0);
}
