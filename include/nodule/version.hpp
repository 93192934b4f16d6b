#pragma once

#include <nodule/result.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace nodule {

// Full version: major.minor.patch[-prerelease][+build]
struct Version {
    int64_t major = 0;
    int64_t minor = 0;
    int64_t patch = 0;
    std::vector<std::string> prerelease;  // dot-separated identifiers
    std::vector<std::string> build;       // ignored for precedence

    // Strict SemVer 2.0, no prefix. Ranges accept 'v' and '=' via PartialVersion.
    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool is_prerelease() const { return !prerelease.empty(); }
    bool same_core(const Version& o) const;

    // <0, 0, >0 by SemVer precedence
    int compare(const Version& o) const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

// Partial version inside a range: "1", "1.2", "1.x", "*", "1.2.3-rc.1"
struct PartialVersion {
    int64_t major = -1;  // -1 means wildcard / unset
    int64_t minor = -1;
    int64_t patch = -1;
    std::vector<std::string> prerelease;

    static Result<PartialVersion> parse(const std::string& s);
    std::string to_string() const;

    bool is_any() const { return major < 0; }
    bool is_full() const { return patch >= 0; }

    // Missing components filled with zero
    Version floor() const;
};

// Primitive comparison operators; caret, tilde, x- and hyphen ranges are
// desugared into these at parse time
enum class ConstraintOp {
    Exact,       // =1.2.3
    GreaterEq,   // >=1.2.3
    Greater,     // >1.2.3
    LessEq,      // <=1.2.3
    Less,        // <1.2.3
};

struct VersionConstraint {
    ConstraintOp op;
    Version version;

    bool matches(const Version& v) const;
    std::string to_string() const;
};

// All constraints must hold. Empty means "any release".
struct ConstraintSet {
    std::vector<VersionConstraint> constraints;

    bool matches(const Version& v) const;
    std::string to_string() const;
};

// npm range syntax: ">=1.0.0 <2.0.0 || ^3.1", "~1.2", "1.x", "1.0 - 2.0".
// Commas are accepted as an AND separator as well.
struct VersionReq {
    std::vector<ConstraintSet> sets;  // satisfied if any set matches

    static Result<VersionReq> parse(const std::string& s);
    bool matches(const Version& v) const;
    std::string to_string() const;
};

} // namespace nodule
