#include <catch2/catch_test_macros.hpp>
#include "vfs/trie_index.hpp"

using namespace tvfs::vfs;

namespace {

Leaf make_leaf(const std::string& path) {
    Leaf leaf;
    leaf.mount_path = path;
    leaf.data.src_filepath = "plugin://client" + path;
    return leaf;
}

Directory make_dir(const std::string& path) {
    Directory dir;
    dir.mount_path = path;
    return dir;
}

} // namespace

TEST_CASE("TrieIndex prefix lookup", "[trie]") {
    TrieIndex index;
    index.insert("/docs/b.md", make_leaf("/docs/b.md"));
    index.insert("/docs", make_dir("/docs"));
    index.insert("/docs/a.md", make_leaf("/docs/a.md"));
    index.insert("/notes/c.md", make_leaf("/notes/c.md"));

    CHECK(index.size() == 4);

    auto docs = index.get("/docs");
    REQUIRE(docs.size() == 3);
    // Key order
    CHECK(entry_path(docs[0]) == "/docs");
    CHECK(entry_path(docs[1]) == "/docs/a.md");
    CHECK(entry_path(docs[2]) == "/docs/b.md");

    CHECK(index.get("").size() == 4);
    CHECK(index.get("/missing").empty());
    CHECK(index.has_prefix("/no"));
    CHECK_FALSE(index.has_prefix("/nox"));
}

TEST_CASE("TrieIndex is case-sensitive", "[trie]") {
    TrieIndex index;
    index.insert("/Docs/a.md", make_leaf("/Docs/a.md"));
    CHECK(index.get("/docs").empty());
    CHECK(index.get("/Docs").size() == 1);
}

TEST_CASE("TrieIndex insert appends under an existing key", "[trie]") {
    TrieIndex index;
    index.insert("/a.md", make_leaf("/a.md"));
    index.insert("/a.md", make_leaf("/a.md"));
    CHECK(index.size() == 2);
    CHECK(index.get("/a.md").size() == 2);
}

TEST_CASE("TrieIndex remove", "[trie]") {
    TrieIndex index;
    index.insert("/docs", make_dir("/docs"));
    index.insert("/docs/a.md", make_leaf("/docs/a.md"));
    index.insert("/docs/a.md", make_leaf("/docs/a.md"));

    SECTION("removes every entry under exactly the key") {
        CHECK(index.remove("/docs/a.md") == 2);
        CHECK(index.size() == 1);
        CHECK(index.get("/docs").size() == 1);
        CHECK_FALSE(index.has_prefix("/docs/"));
    }

    SECTION("leaves longer keys alone") {
        CHECK(index.remove("/docs") == 1);
        CHECK(index.size() == 2);
        CHECK(index.get("/docs/a.md").size() == 2);
    }

    SECTION("absent keys and bare prefixes remove nothing") {
        CHECK(index.remove("/missing") == 0);
        CHECK(index.remove("/do") == 0);
        CHECK(index.size() == 3);
    }
}
