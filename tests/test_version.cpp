#include <catch2/catch.hpp>
#include <nodule/version.hpp>

using namespace nodule;

static Version V(const std::string& s) {
    return Version::parse(s).value();
}

static bool in_range(const std::string& range, const std::string& version) {
    auto req = VersionReq::parse(range);
    REQUIRE(req.is_ok());
    return req.value().matches(V(version));
}

// ===== Version =====

TEST_CASE("parse full version", "[version]") {
    auto r = Version::parse("1.22.333");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().major == 1);
    REQUIRE(r.value().minor == 22);
    REQUIRE(r.value().patch == 333);
    REQUIRE_FALSE(r.value().is_prerelease());
}

TEST_CASE("parse prerelease and build", "[version]") {
    auto v = V("2.0.0-rc.1+sha.5114f85");
    REQUIRE(v.prerelease == std::vector<std::string>{"rc", "1"});
    REQUIRE(v.build == std::vector<std::string>{"sha", "5114f85"});
    REQUIRE(v.to_string() == "2.0.0-rc.1+sha.5114f85");
}

TEST_CASE("prefixed versions are rejected", "[version]") {
    for (const char* s : {"v1.2.3", "=1.2.3", "V1.2.3", " 1.2.3"}) {
        INFO(s);
        REQUIRE(Version::parse(s).is_err());
    }
}

TEST_CASE("invalid versions are rejected", "[version]") {
    for (const char* s : {"", "1", "1.2", "1.2.3.4", "01.2.3", "1.2.x", "a.b.c",
                          "1.2.3-", "1.2.3-01", "1.2.3-a..b", "1.2.3+",
                          "99999999999999999.0.0"}) {
        INFO(s);
        auto r = Version::parse(s);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == NoduleError::Version);
    }
}

TEST_CASE("semver precedence", "[version]") {
    REQUIRE(V("1.0.0") < V("1.0.1"));
    REQUIRE(V("1.9.0") < V("1.10.0"));
    REQUIRE(V("1.0.0-alpha") < V("1.0.0"));

    // Example chain from the SemVer 2.0 document
    const char* chain[] = {"1.0.0-alpha", "1.0.0-alpha.1", "1.0.0-alpha.beta",
                           "1.0.0-beta", "1.0.0-beta.2", "1.0.0-beta.11",
                           "1.0.0-rc.1", "1.0.0"};
    for (size_t i = 0; i + 1 < sizeof(chain) / sizeof(chain[0]); ++i) {
        INFO(chain[i] << " < " << chain[i + 1]);
        REQUIRE(V(chain[i]) < V(chain[i + 1]));
    }
}

TEST_CASE("build metadata is ignored for precedence", "[version]") {
    REQUIRE(V("1.0.0+a") == V("1.0.0+b"));
    REQUIRE(V("1.0.0+a").compare(V("1.0.0")) == 0);
}

// ===== PartialVersion =====

TEST_CASE("partial versions", "[version]") {
    auto p = PartialVersion::parse("1.2").value();
    REQUIRE(p.major == 1);
    REQUIRE(p.minor == 2);
    REQUIRE(p.patch == -1);
    REQUIRE_FALSE(p.is_full());
    REQUIRE(p.floor() == V("1.2.0"));
    REQUIRE(p.to_string() == "1.2.x");

    REQUIRE(PartialVersion::parse("*").value().is_any());
    REQUIRE(PartialVersion::parse("x.x").value().is_any());
    REQUIRE(PartialVersion::parse("1.x.3").is_err());
    REQUIRE(PartialVersion::parse("1.2-beta").is_err());
}

// ===== Ranges =====

TEST_CASE("caret ranges", "[version][range]") {
    REQUIRE(in_range("^1.2.3", "1.2.3"));
    REQUIRE(in_range("^1.2.3", "1.9.0"));
    REQUIRE_FALSE(in_range("^1.2.3", "2.0.0"));
    REQUIRE_FALSE(in_range("^1.2.3", "1.2.2"));

    REQUIRE(in_range("^0.2.3", "0.2.9"));
    REQUIRE_FALSE(in_range("^0.2.3", "0.3.0"));

    REQUIRE(in_range("^0.0.3", "0.0.3"));
    REQUIRE_FALSE(in_range("^0.0.3", "0.0.4"));

    REQUIRE(in_range("^1", "1.99.0"));
    REQUIRE(in_range("^0.x", "0.9.9"));
    REQUIRE_FALSE(in_range("^0.x", "1.0.0"));
}

TEST_CASE("tilde ranges", "[version][range]") {
    REQUIRE(in_range("~1.2.3", "1.2.9"));
    REQUIRE_FALSE(in_range("~1.2.3", "1.3.0"));
    REQUIRE(in_range("~1.2", "1.2.0"));
    REQUIRE(in_range("~1", "1.8.0"));
    REQUIRE_FALSE(in_range("~1", "2.0.0"));
    REQUIRE(in_range("~>1.2", "1.2.5"));
}

TEST_CASE("x-ranges and any", "[version][range]") {
    REQUIRE(in_range("1.x", "1.4.2"));
    REQUIRE_FALSE(in_range("1.x", "2.0.0"));
    REQUIRE(in_range("1.2.*", "1.2.7"));
    REQUIRE(in_range("*", "9.9.9"));
    REQUIRE(in_range("", "0.0.1"));
    REQUIRE(in_range("1", "1.0.0"));
}

TEST_CASE("bare full version is exact", "[version][range]") {
    REQUIRE(in_range("1.2.3", "1.2.3"));
    REQUIRE_FALSE(in_range("1.2.3", "1.2.4"));
    REQUIRE(in_range("=1.2.3", "1.2.3"));
    REQUIRE(in_range("v1.2.3", "1.2.3"));
    REQUIRE(in_range("^v1.2", "1.4.0"));
}

TEST_CASE("primitive comparators", "[version][range]") {
    REQUIRE(in_range(">=1.0.0 <2.0.0", "1.5.0"));
    REQUIRE_FALSE(in_range(">=1.0.0 <2.0.0", "2.0.0"));
    REQUIRE(in_range(">= 1.0.0, < 2.0.0", "1.0.0"));
    REQUIRE(in_range(">1.2", "1.3.0"));
    REQUIRE_FALSE(in_range(">1.2", "1.2.9"));
    REQUIRE(in_range("<=1.2", "1.2.9"));
    REQUIRE_FALSE(in_range("<=1.2", "1.3.0"));
    REQUIRE_FALSE(in_range(">*", "1.0.0"));
}

TEST_CASE("hyphen ranges", "[version][range]") {
    REQUIRE(in_range("1.2.3 - 2.3.4", "1.2.3"));
    REQUIRE(in_range("1.2.3 - 2.3.4", "2.3.4"));
    REQUIRE_FALSE(in_range("1.2.3 - 2.3.4", "2.3.5"));
    REQUIRE(in_range("1.2 - 2.3", "2.3.9"));
    REQUIRE_FALSE(in_range("1.2 - 2.3", "2.4.0"));
}

TEST_CASE("alternatives", "[version][range]") {
    REQUIRE(in_range("^1.0.0 || ^3.0.0", "3.1.0"));
    REQUIRE_FALSE(in_range("^1.0.0 || ^3.0.0", "2.1.0"));
    REQUIRE(in_range("1.0.0||2.0.0", "2.0.0"));
}

TEST_CASE("prereleases need an opt-in on the same core", "[version][range]") {
    REQUIRE_FALSE(in_range("^1.0.0", "1.5.0-beta.1"));
    REQUIRE(in_range(">=1.5.0-beta.0 <2.0.0", "1.5.0-beta.1"));
    REQUIRE_FALSE(in_range(">=1.5.0-beta.0 <2.0.0", "1.6.0-beta.1"));
    REQUIRE(in_range(">=1.5.0-beta.0 <2.0.0", "1.6.0"));
    REQUIRE_FALSE(in_range("*", "1.0.0-rc.1"));
}

TEST_CASE("malformed ranges are InvalidRange", "[version][range]") {
    for (const char* s : {"not-a-range", ">=", "^", "1.2.3.4", ">=>1", "^1.x.3",
                          "1.0.0 - ", "latest", "1.2.3 ||| 2"}) {
        INFO(s);
        auto r = VersionReq::parse(s);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == NoduleError::InvalidRange);
    }
}

TEST_CASE("range to_string shows desugared comparators", "[version][range]") {
    REQUIRE(VersionReq::parse("^1.2.3").value().to_string() == ">=1.2.3 <2.0.0");
    REQUIRE(VersionReq::parse("~0.4").value().to_string() == ">=0.4.0 <0.5.0");
    REQUIRE(VersionReq::parse("*").value().to_string() == "*");
    REQUIRE(VersionReq::parse("1.x || 3.0.1").value().to_string() ==
            ">=1.0.0 <2.0.0 || =3.0.1");
}
