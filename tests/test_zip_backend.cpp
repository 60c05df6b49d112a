#include <catch2/catch_test_macros.hpp>
#include "temp_dir.hpp"
#include "vfs/trie_vfs.hpp"
#include "vfs/zip_backend.hpp"

#include <cstring>
#include <utility>
#include <vector>
#include <minizip/zip.h>

using namespace tvfs;
using namespace tvfs::vfs;

namespace {

bool write_zip(const std::filesystem::path& path,
               const std::vector<std::pair<std::string, std::string>>& files) {
    zipFile zf = zipOpen(path.string().c_str(), APPEND_STATUS_CREATE);
    if (!zf) return false;

    bool ok = true;
    for (const auto& [name, content] : files) {
        if (zipOpenNewFileInZip(zf, name.c_str(), nullptr, nullptr, 0, nullptr,
                                0, nullptr, Z_DEFLATED,
                                Z_DEFAULT_COMPRESSION) != ZIP_OK) {
            ok = false;
            break;
        }
        if (!content.empty() &&
            zipWriteInFileInZip(zf, content.data(),
                                static_cast<unsigned>(content.size())) != ZIP_OK) {
            ok = false;
        }
        zipCloseFileInZip(zf);
    }
    return zipClose(zf, nullptr) == ZIP_OK && ok;
}

} // namespace

TEST_CASE("ZipBackend indexes and reads an archive", "[backend]") {
    test::TempDir dir;
    auto archive = dir.path() / "bundle.zip";
    REQUIRE(write_zip(archive, {
        {"client/notebooks/readme.md", "# Zipped Readme\ncompressed body\n"},
        {"client/notebooks/", ""},
        {"plugin-kubectl/notebooks/intro.json", "{\"cells\": []}"},
        {"client/notebooks/empty.md", ""},
    }));

    ZipBackend backend(archive);
    REQUIRE(backend.is_open());
    CHECK(backend.file_count() == 3);

    CHECK(backend.bundle_file_exists("client/notebooks/readme.md"));
    CHECK(backend.bundle_file_exists("/client/./notebooks/readme.md"));
    CHECK_FALSE(backend.bundle_file_exists("client/notebooks"));
    CHECK_FALSE(backend.bundle_file_exists("Client/Notebooks/README.md"));

    auto data = backend.read_bundle_file("plugin-kubectl/notebooks/intro.json");
    REQUIRE(data.has_value());
    CHECK(std::string(data->begin(), data->end()) == "{\"cells\": []}");

    auto empty = backend.read_bundle_file("client/notebooks/empty.md");
    REQUIRE(empty.has_value());
    CHECK(empty->empty());

    CHECK_FALSE(backend.read_bundle_file("client/notebooks/none.md").has_value());
}

TEST_CASE("ZipBackend with an unreadable archive", "[backend]") {
    test::TempDir dir;
    auto bogus = dir.write("not_a_zip.zip", "plain text");

    ZipBackend backend(bogus);
    CHECK_FALSE(backend.is_open());
    CHECK(backend.file_count() == 0);
    CHECK_FALSE(backend.read_bundle_file("anything").has_value());
}

TEST_CASE("TrieVfs over a ZIP bundle loads concurrently", "[backend]") {
    test::TempDir dir;
    auto archive = dir.path() / "bundle.zip";

    std::vector<std::pair<std::string, std::string>> files;
    std::vector<std::string> sources;
    for (int i = 0; i < 16; i++) {
        auto stem = "note" + std::to_string(i);
        files.push_back({"client/notebooks/" + stem + ".md",
                         "# Note " + std::to_string(i) + "\n" +
                             (i % 2 == 0 ? "even\n" : "odd\n")});
        sources.push_back("plugin://client/notebooks/" + stem + ".md");
    }
    REQUIRE(write_zip(archive, files));

    auto backend = std::make_unique<ZipBackend>(archive);
    REQUIRE(backend->is_open());

    TrieVfs vfs("/kui", std::move(backend));
    REQUIRE(vfs.mkdir("/kui/notes").ok());
    REQUIRE(vfs.cp(sources, "/kui/notes").ok());

    auto hits = vfs.grepdir({"/kui/notes"}, "even");
    REQUIRE(hits.ok());
    CHECK(hits.value().size() == 8);

    auto listing = vfs.ls({}, {"/kui/notes/note1.md", "/kui/notes/note2.md"});
    REQUIRE(listing.size() == 2);
    CHECK(listing[0].name_for_display == "Note 1");
    CHECK(listing[1].name_for_display == "Note 2");
}
