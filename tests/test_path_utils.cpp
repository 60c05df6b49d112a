#include <catch2/catch_test_macros.hpp>
#include "vfs/path_utils.hpp"

using namespace tvfs::vfs;

TEST_CASE("Path normalization", "[path]") {
    CHECK(normalize("/foo/bar") == "/foo/bar");
    CHECK(normalize("/foo//bar") == "/foo/bar");
    CHECK(normalize("/foo/./bar") == "/foo/bar");
    CHECK(normalize("/foo/../bar") == "/bar");
    CHECK(normalize("\\foo\\bar") == "/foo/bar");
    CHECK(normalize("foo/bar") == "/foo/bar");
    CHECK(normalize("/foo/bar/") == "/foo/bar");
    CHECK(normalize("/foo/bar/..") == "/foo");
    CHECK(normalize("/foo/.") == "/foo");
    CHECK(normalize("/") == "/");
    CHECK(normalize("") == "/");
}

TEST_CASE("Normalization keeps case", "[path]") {
    CHECK(normalize("/Kui/README.md") == "/Kui/README.md");
}

TEST_CASE("basename and dirname", "[path]") {
    CHECK(basename("/a/b/c.md") == "c.md");
    CHECK(basename("/a/b/") == "b");
    CHECK(basename("c.md") == "c.md");
    CHECK(basename("/") == "/");

    CHECK(dirname("/a/b/c.md") == "/a/b");
    CHECK(dirname("/a") == "/");
    CHECK(dirname("/a/b/") == "/a");
    CHECK(dirname("a") == ".");
}

TEST_CASE("join uses exactly one separator", "[path]") {
    CHECK(join("/a", "b.md") == "/a/b.md");
    CHECK(join("/a/", "b.md") == "/a/b.md");
    CHECK(join("/a", "/b.md") == "/a/b.md");
    CHECK(join("/", "b.md") == "/b.md");
    CHECK(join("", "b.md") == "b.md");
}

TEST_CASE("extension", "[path]") {
    CHECK(extension("/a/readme.md") == "md");
    CHECK(extension("/a/archive.tar.gz") == "gz");
    CHECK(extension("/a/Makefile").empty());
    CHECK(extension("/a/.hidden").empty());
    CHECK(extension("/a/trailing.").empty());
    CHECK(extension("/a.d/file").empty());
}

TEST_CASE("MountPrefix strips and applies", "[path]") {
    MountPrefix prefix("/kui");

    CHECK(prefix.mount_path() == "/kui");
    CHECK(prefix.matches("/kui"));
    CHECK(prefix.matches("/kui/docs"));
    CHECK_FALSE(prefix.matches("/kuix"));
    CHECK_FALSE(prefix.matches("/other"));

    CHECK(prefix.strip("/kui/docs/a.md") == "/docs/a.md");
    CHECK(prefix.strip("/kui") == "/");
    CHECK(prefix.strip("/kui/") == "/");
    // Already mount-relative
    CHECK(prefix.strip("/docs") == "/docs");
    CHECK(prefix.strip("docs") == "/docs");

    CHECK(prefix.apply("/docs/a.md") == "/kui/docs/a.md");
    CHECK(prefix.apply("/") == "/kui");
}

TEST_CASE("MountPrefix normalizes its mount path", "[path]") {
    MountPrefix prefix("kui/");
    CHECK(prefix.mount_path() == "/kui");
}

TEST_CASE("Root mount passes paths through", "[path]") {
    MountPrefix prefix("/");
    CHECK(prefix.matches("/anything"));
    CHECK(prefix.strip("/a/b") == "/a/b");
    CHECK(prefix.apply("/a/b") == "/a/b");
    CHECK(prefix.apply("/") == "/");
}
