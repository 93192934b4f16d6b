#include <catch2/catch.hpp>
#include <nodule/lockfile.hpp>

#include "support.hpp"

using namespace nodule;

static LockEntry make_entry(const std::string& version,
                            std::optional<DependencyMap> deps = std::nullopt) {
    LockEntry e;
    e.version = version;
    e.resolved_url = "https://registry.npmjs.org/pkg/-/pkg-" + version + ".tgz";
    e.integrity = "sha512-AAAA";
    e.dependencies = std::move(deps);
    return e;
}

// ===== LockFile::parse =====

TEST_CASE("parse lock file entries", "[lockfile]") {
    auto r = LockFile::parse(R"({
        "lodash": {
            "version": "4.17.21",
            "resolved_url": "https://registry.npmjs.org/lodash/-/lodash-4.17.21.tgz",
            "integrity": "sha512-v2kDEe57lecTulaDIuNTPy3Ry4gLGJ6Z1O3vE1krgXZNrsQ+LFTGHVxVjcXPs17LhbZVGedAJv8XZ1tvj5FvSg=="
        },
        "express": {
            "version": "4.18.2",
            "resolved_url": "https://registry.npmjs.org/express/-/express-4.18.2.tgz",
            "integrity": "sha512-x",
            "dependencies": { "accepts": "~1.3.8" }
        }
    })");
    REQUIRE(r.is_ok());
    auto& lf = r.value();
    REQUIRE(lf.size() == 2);

    const LockEntry* lodash = lf.find("lodash");
    REQUIRE(lodash != nullptr);
    REQUIRE(lodash->version == "4.17.21");
    REQUIRE_FALSE(lodash->dependencies.has_value());

    const LockEntry* express = lf.find("express");
    REQUIRE(express != nullptr);
    REQUIRE(express->dependencies == DependencyMap{{"accepts", "~1.3.8"}});

    REQUIRE(lf.find("react") == nullptr);
}

TEST_CASE("optional fields may be null or absent", "[lockfile]") {
    auto r = LockFile::parse(R"({
        "a": { "version": "1.0.0", "resolved_url": "u", "integrity": null, "dependencies": null },
        "b": { "version": "1.0.0", "resolved_url": "u" }
    })");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().find("a")->integrity.empty());
    REQUIRE_FALSE(r.value().find("a")->dependencies.has_value());
    REQUIRE(r.value().find("b")->integrity.empty());
}

TEST_CASE("malformed lock files are Lockfile errors", "[lockfile]") {
    for (const char* s : {"not json", "[]", R"({"a": 1})",
                          R"({"a": {"resolved_url": "u"}})",
                          R"({"a": {"version": "1.0.0"}})",
                          R"({"a": {"version": 1, "resolved_url": "u"}})",
                          R"({"a": {"version": "1", "resolved_url": "u", "integrity": 5}})",
                          R"({"a": {"version": "1", "resolved_url": "u", "dependencies": {"b": true}}})"}) {
        INFO(s);
        auto r = LockFile::parse(s, "dep-lock.json");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == NoduleError::Lockfile);
    }
}

// ===== load / save =====

TEST_CASE("absent lock file loads empty", "[lockfile]") {
    TempDir td("lockfile");
    auto r = LockFile::load((td.path / "dep-lock.json").string());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().empty());
}

TEST_CASE("save then load yields the same entries", "[lockfile]") {
    TempDir td("lockfile");
    std::string path = (td.path / "dep-lock.json").string();

    LockFile lf;
    lf.upsert("zeta", make_entry("1.0.0"));
    lf.upsert("alpha", make_entry("2.1.0", DependencyMap{{"zeta", "^1"}}));
    lf.upsert("empty-deps", make_entry("0.1.0", DependencyMap{}));
    REQUIRE(lf.save(path).is_ok());
    REQUIRE_FALSE(fs::exists(path + ".tmp"));

    auto loaded = LockFile::load(path);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value() == lf);
    REQUIRE(loaded.value().find("empty-deps")->dependencies == DependencyMap{});
}

TEST_CASE("dump is pretty, sorted and omits absent dependencies", "[lockfile]") {
    LockFile lf;
    lf.upsert("b", make_entry("1.0.0"));
    lf.upsert("a", make_entry("2.0.0", DependencyMap{{"b", "1.0.0"}}));

    std::string expected =
        "{\n"
        "  \"a\": {\n"
        "    \"dependencies\": {\n"
        "      \"b\": \"1.0.0\"\n"
        "    },\n"
        "    \"integrity\": \"sha512-AAAA\",\n"
        "    \"resolved_url\": \"https://registry.npmjs.org/pkg/-/pkg-2.0.0.tgz\",\n"
        "    \"version\": \"2.0.0\"\n"
        "  },\n"
        "  \"b\": {\n"
        "    \"integrity\": \"sha512-AAAA\",\n"
        "    \"resolved_url\": \"https://registry.npmjs.org/pkg/-/pkg-1.0.0.tgz\",\n"
        "    \"version\": \"1.0.0\"\n"
        "  }\n"
        "}\n";
    REQUIRE(lf.dump() == expected);
}

TEST_CASE("saving twice is byte-identical", "[lockfile]") {
    TempDir td("lockfile");
    std::string path = (td.path / "dep-lock.json").string();

    LockFile lf;
    lf.upsert("x", make_entry("1.0.0"));
    REQUIRE(lf.save(path).is_ok());
    std::string first = read_file(path);

    auto reloaded = LockFile::load(path).value();
    REQUIRE(reloaded.save(path).is_ok());
    REQUIRE(read_file(path) == first);
}

TEST_CASE("save into a missing directory is a Persistence error", "[lockfile]") {
    TempDir td("lockfile");
    LockFile lf;
    lf.upsert("x", make_entry("1.0.0"));
    auto st = lf.save((td.path / "no" / "such" / "dir" / "dep-lock.json").string());
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == NoduleError::Persistence);
}

TEST_CASE("upsert overwrites an existing entry", "[lockfile]") {
    LockFile lf;
    lf.upsert("x", make_entry("1.0.0"));
    lf.upsert("x", make_entry("2.0.0"));
    REQUIRE(lf.size() == 1);
    REQUIRE(lf.find("x")->version == "2.0.0");
}
