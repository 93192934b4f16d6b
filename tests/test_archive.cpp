#include <catch2/catch.hpp>
#include <nodule/archive.hpp>

#include "support.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <utility>
#include <vector>

using namespace nodule;

namespace {

struct Member {
    std::string path;
    std::string content;
    int mode = 0644;
    bool directory = false;
};

// Build a gzip-compressed ustar archive in memory
std::string make_tgz(const std::vector<Member>& members) {
    std::vector<char> buf(1 << 20);
    size_t used = 0;

    struct archive* a = archive_write_new();
    archive_write_add_filter_gzip(a);
    archive_write_set_format_pax_restricted(a);
    REQUIRE(archive_write_open_memory(a, buf.data(), buf.size(), &used) == ARCHIVE_OK);

    for (const auto& m : members) {
        struct archive_entry* e = archive_entry_new();
        archive_entry_set_pathname(e, m.path.c_str());
        archive_entry_set_filetype(e, m.directory ? AE_IFDIR : AE_IFREG);
        archive_entry_set_perm(e, m.directory ? 0755 : m.mode);
        archive_entry_set_size(e, m.directory ? 0 : static_cast<la_int64_t>(m.content.size()));
        REQUIRE(archive_write_header(a, e) == ARCHIVE_OK);
        if (!m.directory && !m.content.empty()) {
            archive_write_data(a, m.content.data(), m.content.size());
        }
        archive_entry_free(e);
    }

    archive_write_close(a);
    archive_write_free(a);
    return std::string(buf.data(), used);
}

} // namespace

// ===== strip_member_path =====

TEST_CASE("strip leading components", "[archive]") {
    REQUIRE(strip_member_path("package/index.js", 1).value() == "index.js");
    REQUIRE(strip_member_path("package/lib/a.js", 1).value() == "lib/a.js");
    REQUIRE(strip_member_path("./package/lib/", 1).value() == "lib");
    REQUIRE(strip_member_path("package", 1).value().empty());
    REQUIRE(strip_member_path("package/", 1).value().empty());
    REQUIRE(strip_member_path("a//b", 0).value() == "a/b");
}

TEST_CASE("escaping member paths are rejected", "[archive]") {
    for (const char* s : {"/etc/passwd", "package/../../evil", ".."}) {
        INFO(s);
        auto r = strip_member_path(s, 1);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == NoduleError::Extract);
    }
}

// ===== TarGzExtractor =====

TEST_CASE("npm-style tarball is unpacked without its top directory", "[archive]") {
    TempDir td("archive");
    std::string tgz = make_tgz({
        {"package", "", 0, true},
        {"package/package.json", R"({"name":"left-pad"})"},
        {"package/lib/index.js", "module.exports = 1;\n"},
        {"package/bin/cli", "#!/bin/sh\n", 0755},
    });

    TarGzExtractor extractor;
    fs::path dest = td.path / "node_modules" / "left-pad";
    auto st = extractor.extract(tgz, dest);
    REQUIRE(st.is_ok());

    REQUIRE(read_file(dest / "package.json") == R"({"name":"left-pad"})");
    REQUIRE(read_file(dest / "lib" / "index.js") == "module.exports = 1;\n");
    REQUIRE_FALSE(fs::exists(dest / "package"));

    auto perms = fs::status(dest / "bin" / "cli").permissions();
    REQUIRE((perms & fs::perms::owner_exec) != fs::perms::none);
}

TEST_CASE("top directory name does not matter", "[archive]") {
    TempDir td("archive");
    std::string tgz = make_tgz({{"node/README.md", "hi"}});

    TarGzExtractor extractor;
    REQUIRE(extractor.extract(tgz, td.path / "out").is_ok());
    REQUIRE(read_file(td.path / "out" / "README.md") == "hi");
}

TEST_CASE("strip_components of zero keeps the layout", "[archive]") {
    TempDir td("archive");
    std::string tgz = make_tgz({{"package/a.txt", "a"}});

    TarGzExtractor extractor(0);
    REQUIRE(extractor.extract(tgz, td.path).is_ok());
    REQUIRE(read_file(td.path / "package" / "a.txt") == "a");
}

TEST_CASE("re-extracting overwrites existing files", "[archive]") {
    TempDir td("archive");
    TarGzExtractor extractor;
    REQUIRE(extractor.extract(make_tgz({{"package/v.txt", "one"}}), td.path).is_ok());
    REQUIRE(extractor.extract(make_tgz({{"package/v.txt", "two"}}), td.path).is_ok());
    REQUIRE(read_file(td.path / "v.txt") == "two");
}

TEST_CASE("path traversal member aborts extraction", "[archive]") {
    TempDir td("archive");
    std::string tgz = make_tgz({{"package/../../escaped.txt", "x"}});

    TarGzExtractor extractor;
    auto st = extractor.extract(tgz, td.path / "dest");
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == NoduleError::Extract);
    REQUIRE_FALSE(fs::exists(td.path / "escaped.txt"));
}

TEST_CASE("garbage bytes are an Extract error", "[archive]") {
    TempDir td("archive");
    TarGzExtractor extractor;
    auto st = extractor.extract("definitely not a tarball", td.path);
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == NoduleError::Extract);
}
