#include <catch2/catch_test_macros.hpp>
#include "lua/lua_state.hpp"
#include "temp_dir.hpp"
#include "vfs/mount_table.hpp"

extern "C" {
#include <lua.h>
}

using namespace tvfs::lua;

TEST_CASE("LuaState creation and basic execution", "[lua]") {
    LuaState state;
    REQUIRE(state.raw() != nullptr);

    auto result = state.do_string("x = 1 + 2");
    REQUIRE(result.ok());

    lua_getglobal(state.raw(), "x");
    CHECK(lua_tonumber(state.raw(), -1) == 3);
    lua_pop(state.raw(), 1);
}

TEST_CASE("LuaState register and call C function", "[lua]") {
    LuaState state;

    static int called = 0;
    state.register_function("test_fn", [](lua_State* L) -> int {
        called++;
        lua_pushnumber(L, 42);
        return 1;
    });

    called = 0;
    auto result = state.do_string("result = test_fn()");
    REQUIRE(result.ok());
    CHECK(called == 1);
    CHECK(state.has_function("test_fn"));
    CHECK_FALSE(state.has_function("result"));
    CHECK_FALSE(state.has_function("missing"));
}

TEST_CASE("LuaState global strings", "[lua]") {
    LuaState state;
    state.set_global_string("Greeting", "hello");

    REQUIRE(state.do_string("ok = (Greeting == 'hello')").ok());
    lua_getglobal(state.raw(), "ok");
    CHECK(lua_toboolean(state.raw(), -1) == 1);
    lua_pop(state.raw(), 1);
}

TEST_CASE("LuaState reports errors", "[lua]") {
    LuaState state;

    auto syntax = state.do_string("this is not lua");
    REQUIRE_FALSE(syntax.ok());
    CHECK_FALSE(syntax.error().message.empty());

    auto runtime = state.do_string("error('boom')");
    REQUIRE_FALSE(runtime.ok());
    CHECK(runtime.error().message.find("boom") != std::string::npos);

    // The state stays usable after a failed chunk
    CHECK(state.do_string("y = 1").ok());
}

TEST_CASE("LuaState opens only the safe libraries", "[lua]") {
    LuaState state;
    REQUIRE(state.do_string(
        "has_string = (string ~= nil) "
        "has_math = (math ~= nil) "
        "has_io = (io ~= nil) "
        "has_os = (os ~= nil)").ok());

    auto global_bool = [&](const char* name) {
        lua_getglobal(state.raw(), name);
        bool v = lua_toboolean(state.raw(), -1) != 0;
        lua_pop(state.raw(), 1);
        return v;
    };
    CHECK(global_bool("has_string"));
    CHECK(global_bool("has_math"));
    CHECK_FALSE(global_bool("has_io"));
    CHECK_FALSE(global_bool("has_os"));
}

TEST_CASE("LuaState strips a UTF-8 BOM", "[lua]") {
    LuaState state;
    const char chunk[] = "\xEF\xBB\xBFz = 7";
    REQUIRE(state.do_buffer(chunk, sizeof(chunk) - 1, "=bom").ok());

    lua_getglobal(state.raw(), "z");
    CHECK(lua_tonumber(state.raw(), -1) == 7);
    lua_pop(state.raw(), 1);
}

TEST_CASE("LuaState executes files", "[lua]") {
    tvfs::test::TempDir dir;
    auto script = dir.write("script.lua", "from_file = 'yes'\n");

    LuaState state;
    REQUIRE(state.do_file(script).ok());
    CHECK_FALSE(state.do_file(dir.path() / "missing.lua").ok());
}

TEST_CASE("LuaState stores the mount table", "[lua]") {
    LuaState state;
    CHECK(LuaState::get_mount_table(state.raw()) == nullptr);

    tvfs::vfs::MountTable mounts;
    state.set_mount_table(&mounts);
    CHECK(LuaState::get_mount_table(state.raw()) == &mounts);
}

TEST_CASE("LuaState is movable", "[lua]") {
    LuaState a;
    auto* raw = a.raw();
    LuaState b(std::move(a));
    CHECK(b.raw() == raw);
    CHECK(a.raw() == nullptr);
}
