#include <nodule/version.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace nodule {

// ---------------------------------------------------------------------------
// Identifier helpers
// ---------------------------------------------------------------------------

// Numeric components are capped well below int64 overflow (npm uses
// Number.MAX_SAFE_INTEGER, 16 digits is the same order).
static constexpr size_t MAX_NUMERIC_DIGITS = 16;

static bool is_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c); });
}

static bool parse_numeric(const std::string& s, int64_t& out) {
    if (!is_digits(s)) return false;
    if (s.size() > 1 && s[0] == '0') return false;  // no leading zeros
    if (s.size() > MAX_NUMERIC_DIGITS) return false;
    out = 0;
    for (char c : s) out = out * 10 + (c - '0');
    return true;
}

static bool is_wildcard(const std::string& s) {
    return s == "x" || s == "X" || s == "*";
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : s) {
        if (c == sep) {
            parts.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    parts.push_back(cur);
    return parts;
}

static std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

// Prerelease or build identifiers: [0-9A-Za-z-]+, numeric prerelease
// identifiers without leading zeros.
static bool parse_identifiers(const std::string& s, bool numeric_strict,
                              std::vector<std::string>& out) {
    out = split(s, '.');
    for (const auto& id : out) {
        if (id.empty()) return false;
        for (unsigned char c : id) {
            if (!std::isalnum(c) && c != '-') return false;
        }
        if (numeric_strict && is_digits(id) && id.size() > 1 && id[0] == '0') {
            return false;
        }
    }
    return true;
}

static int compare_identifier(const std::string& a, const std::string& b) {
    bool an = is_digits(a);
    bool bn = is_digits(b);
    if (an && bn) {
        if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
        return a.compare(b) < 0 ? -1 : (a == b ? 0 : 1);
    }
    // Numeric identifiers have lower precedence than alphanumeric ones
    if (an) return -1;
    if (bn) return 1;
    int c = a.compare(b);
    return c < 0 ? -1 : (c == 0 ? 0 : 1);
}

// Split "<core>[-pre][+build]" where core is made of [0-9.xX*]
static void split_version_text(const std::string& s, std::string& core,
                               std::string& pre, std::string& build,
                               bool& has_pre, bool& has_build) {
    size_t plus = s.find('+');
    std::string head = s.substr(0, plus);
    has_build = plus != std::string::npos;
    build = has_build ? s.substr(plus + 1) : "";

    size_t dash = head.find('-');
    has_pre = dash != std::string::npos;
    core = head.substr(0, dash);
    pre = has_pre ? head.substr(dash + 1) : "";
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& s) {
    if (s.empty()) {
        return NoduleError{NoduleError::Version, "empty version string"};
    }

    std::string core, pre, build;
    bool has_pre = false, has_build = false;
    split_version_text(s, core, pre, build, has_pre, has_build);

    auto parts = split(core, '.');
    if (parts.size() != 3) {
        return NoduleError{NoduleError::Version,
            "invalid version '" + s + "'",
            "expected format: major.minor.patch[-prerelease][+build]"};
    }

    Version v;
    if (!parse_numeric(parts[0], v.major) ||
        !parse_numeric(parts[1], v.minor) ||
        !parse_numeric(parts[2], v.patch)) {
        return NoduleError{NoduleError::Version,
            "invalid numeric component in version '" + s + "'"};
    }

    if (has_pre && !parse_identifiers(pre, true, v.prerelease)) {
        return NoduleError{NoduleError::Version,
            "invalid prerelease in version '" + s + "'"};
    }
    if (has_build && !parse_identifiers(build, false, v.build)) {
        return NoduleError{NoduleError::Version,
            "invalid build metadata in version '" + s + "'"};
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(patch);
    if (!prerelease.empty()) {
        s += "-" + join(prerelease, ".");
    }
    if (!build.empty()) {
        s += "+" + join(build, ".");
    }
    return s;
}

bool Version::same_core(const Version& o) const {
    return major == o.major && minor == o.minor && patch == o.patch;
}

int Version::compare(const Version& o) const {
    if (major != o.major) return major < o.major ? -1 : 1;
    if (minor != o.minor) return minor < o.minor ? -1 : 1;
    if (patch != o.patch) return patch < o.patch ? -1 : 1;

    // A release has higher precedence than any of its prereleases
    if (prerelease.empty() && o.prerelease.empty()) return 0;
    if (prerelease.empty()) return 1;
    if (o.prerelease.empty()) return -1;

    size_t n = std::min(prerelease.size(), o.prerelease.size());
    for (size_t i = 0; i < n; ++i) {
        int c = compare_identifier(prerelease[i], o.prerelease[i]);
        if (c != 0) return c;
    }
    if (prerelease.size() == o.prerelease.size()) return 0;
    return prerelease.size() < o.prerelease.size() ? -1 : 1;
}

bool Version::operator==(const Version& o) const { return compare(o) == 0; }
bool Version::operator!=(const Version& o) const { return compare(o) != 0; }
bool Version::operator<(const Version& o) const { return compare(o) < 0; }
bool Version::operator<=(const Version& o) const { return compare(o) <= 0; }
bool Version::operator>(const Version& o) const { return compare(o) > 0; }
bool Version::operator>=(const Version& o) const { return compare(o) >= 0; }

// ---------------------------------------------------------------------------
// PartialVersion
// ---------------------------------------------------------------------------

Result<PartialVersion> PartialVersion::parse(const std::string& s) {
    if (s.empty()) {
        return NoduleError{NoduleError::InvalidRange, "empty partial version"};
    }

    std::string text = s;
    if (text[0] == 'v' || text[0] == 'V') text = text.substr(1);

    std::string core, pre, build;
    bool has_pre = false, has_build = false;
    split_version_text(text, core, pre, build, has_pre, has_build);

    auto parts = split(core, '.');
    if (parts.size() > 3) {
        return NoduleError{NoduleError::InvalidRange,
            "too many components in '" + s + "'"};
    }

    PartialVersion pv;
    int64_t* slots[3] = {&pv.major, &pv.minor, &pv.patch};
    bool wildcard_seen = false;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (is_wildcard(parts[i])) {
            wildcard_seen = true;
            continue;
        }
        if (wildcard_seen) {
            return NoduleError{NoduleError::InvalidRange,
                "number after wildcard in '" + s + "'"};
        }
        if (!parse_numeric(parts[i], *slots[i])) {
            return NoduleError{NoduleError::InvalidRange,
                "invalid version component '" + parts[i] + "' in '" + s + "'"};
        }
    }

    if (has_pre || has_build) {
        if (!pv.is_full()) {
            return NoduleError{NoduleError::InvalidRange,
                "prerelease or build on incomplete version '" + s + "'"};
        }
        std::vector<std::string> ignored;
        if ((has_pre && !parse_identifiers(pre, true, pv.prerelease)) ||
            (has_build && !parse_identifiers(build, false, ignored))) {
            return NoduleError{NoduleError::InvalidRange,
                "invalid prerelease or build in '" + s + "'"};
        }
    }

    return Result<PartialVersion>::ok(std::move(pv));
}

std::string PartialVersion::to_string() const {
    if (major < 0) return "*";
    std::string s = std::to_string(major);
    s += "." + (minor >= 0 ? std::to_string(minor) : std::string("x"));
    s += "." + (patch >= 0 ? std::to_string(patch) : std::string("x"));
    if (!prerelease.empty()) s += "-" + join(prerelease, ".");
    return s;
}

Version PartialVersion::floor() const {
    Version v;
    v.major = major >= 0 ? major : 0;
    v.minor = minor >= 0 ? minor : 0;
    v.patch = patch >= 0 ? patch : 0;
    if (is_full()) v.prerelease = prerelease;
    return v;
}

// ---------------------------------------------------------------------------
// VersionConstraint / ConstraintSet
// ---------------------------------------------------------------------------

bool VersionConstraint::matches(const Version& v) const {
    int c = v.compare(version);
    switch (op) {
    case ConstraintOp::Exact:     return c == 0;
    case ConstraintOp::GreaterEq: return c >= 0;
    case ConstraintOp::Greater:   return c > 0;
    case ConstraintOp::LessEq:    return c <= 0;
    case ConstraintOp::Less:      return c < 0;
    }
    return false;
}

std::string VersionConstraint::to_string() const {
    std::string prefix;
    switch (op) {
    case ConstraintOp::Exact:     prefix = "="; break;
    case ConstraintOp::GreaterEq: prefix = ">="; break;
    case ConstraintOp::Greater:   prefix = ">"; break;
    case ConstraintOp::LessEq:    prefix = "<="; break;
    case ConstraintOp::Less:      prefix = "<"; break;
    }
    return prefix + version.to_string();
}

bool ConstraintSet::matches(const Version& v) const {
    for (const auto& c : constraints) {
        if (!c.matches(v)) return false;
    }
    if (!v.is_prerelease()) return true;

    // Prereleases are only eligible when the range names a prerelease of
    // the same major.minor.patch
    return std::any_of(constraints.begin(), constraints.end(),
        [&](const VersionConstraint& c) {
            return c.version.is_prerelease() && c.version.same_core(v);
        });
}

std::string ConstraintSet::to_string() const {
    if (constraints.empty()) return "*";
    std::string s;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (i > 0) s += " ";
        s += constraints[i].to_string();
    }
    return s;
}

// ---------------------------------------------------------------------------
// Range desugaring
// ---------------------------------------------------------------------------

static Version make_version(int64_t major, int64_t minor, int64_t patch) {
    Version v;
    v.major = major;
    v.minor = minor;
    v.patch = patch;
    return v;
}

// Exclusive upper bound of an x-range: 1 -> 2.0.0, 1.2 -> 1.3.0
static Version x_range_ceiling(const PartialVersion& pv) {
    if (pv.minor < 0) return make_version(pv.major + 1, 0, 0);
    return make_version(pv.major, pv.minor + 1, 0);
}

static void push(ConstraintSet& set, ConstraintOp op, Version v) {
    set.constraints.push_back(VersionConstraint{op, std::move(v)});
}

static void desugar_x_range(const PartialVersion& pv, ConstraintSet& set) {
    if (pv.is_any()) return;
    if (pv.is_full()) {
        push(set, ConstraintOp::Exact, pv.floor());
        return;
    }
    push(set, ConstraintOp::GreaterEq, pv.floor());
    push(set, ConstraintOp::Less, x_range_ceiling(pv));
}

static void desugar_tilde(const PartialVersion& pv, ConstraintSet& set) {
    if (pv.is_any()) return;
    push(set, ConstraintOp::GreaterEq, pv.floor());
    if (pv.minor < 0) {
        push(set, ConstraintOp::Less, make_version(pv.major + 1, 0, 0));
    } else {
        push(set, ConstraintOp::Less, make_version(pv.major, pv.minor + 1, 0));
    }
}

// ^1.2.3 := >=1.2.3 <2.0.0, ^0.2.3 := >=0.2.3 <0.3.0, ^0.0.3 := >=0.0.3 <0.0.4
static void desugar_caret(const PartialVersion& pv, ConstraintSet& set) {
    if (pv.is_any()) return;
    push(set, ConstraintOp::GreaterEq, pv.floor());

    if (pv.major > 0 || pv.minor < 0) {
        push(set, ConstraintOp::Less, make_version(pv.major + 1, 0, 0));
    } else if (pv.minor > 0 || pv.patch < 0) {
        push(set, ConstraintOp::Less, make_version(0, pv.minor + 1, 0));
    } else {
        push(set, ConstraintOp::Less, make_version(0, 0, pv.patch + 1));
    }
}

static void desugar_primitive(ConstraintOp op, const PartialVersion& pv,
                              ConstraintSet& set) {
    if (pv.is_any()) {
        // ">*" and "<*" can never be satisfied; ">=*" and "<=*" mean anything
        if (op == ConstraintOp::Greater || op == ConstraintOp::Less) {
            push(set, ConstraintOp::Less, make_version(0, 0, 0));
        }
        return;
    }
    if (pv.is_full()) {
        push(set, op, pv.floor());
        return;
    }

    switch (op) {
    case ConstraintOp::Exact:
        desugar_x_range(pv, set);
        break;
    case ConstraintOp::GreaterEq:
    case ConstraintOp::Less:
        push(set, op, pv.floor());
        break;
    case ConstraintOp::Greater:
        // >1 := >=2.0.0, >1.2 := >=1.3.0
        push(set, ConstraintOp::GreaterEq, x_range_ceiling(pv));
        break;
    case ConstraintOp::LessEq:
        // <=1.2 := <1.3.0
        push(set, ConstraintOp::Less, x_range_ceiling(pv));
        break;
    }
}

static Status parse_simple(const std::string& token, ConstraintSet& set) {
    size_t pos = 0;
    enum { None, Caret, Tilde, Primitive } kind = None;
    ConstraintOp op = ConstraintOp::Exact;

    if (token.compare(0, 2, ">=") == 0) {
        kind = Primitive; op = ConstraintOp::GreaterEq; pos = 2;
    } else if (token.compare(0, 2, "<=") == 0) {
        kind = Primitive; op = ConstraintOp::LessEq; pos = 2;
    } else if (token.compare(0, 2, "~>") == 0) {
        kind = Tilde; pos = 2;
    } else if (token[0] == '>') {
        kind = Primitive; op = ConstraintOp::Greater; pos = 1;
    } else if (token[0] == '<') {
        kind = Primitive; op = ConstraintOp::Less; pos = 1;
    } else if (token[0] == '=') {
        kind = Primitive; op = ConstraintOp::Exact; pos = 1;
    } else if (token[0] == '^') {
        kind = Caret; pos = 1;
    } else if (token[0] == '~') {
        kind = Tilde; pos = 1;
    }

    auto pv = PartialVersion::parse(token.substr(pos));
    if (pv.is_err()) return std::move(pv).error();

    switch (kind) {
    case None:      desugar_x_range(pv.value(), set); break;
    case Caret:     desugar_caret(pv.value(), set); break;
    case Tilde:     desugar_tilde(pv.value(), set); break;
    case Primitive: desugar_primitive(op, pv.value(), set); break;
    }
    return ok_status();
}

static bool is_operator_only(const std::string& t) {
    return t == ">" || t == ">=" || t == "<" || t == "<=" ||
           t == "=" || t == "^" || t == "~" || t == "~>";
}

// "1.2 - 2.3.4" := >=1.2.0 <=2.3.4; a partial upper bound is exclusive
static Status parse_hyphen(const std::string& lo, const std::string& hi,
                           ConstraintSet& set) {
    auto low = PartialVersion::parse(lo);
    if (low.is_err()) return std::move(low).error();
    auto high = PartialVersion::parse(hi);
    if (high.is_err()) return std::move(high).error();

    if (!low.value().is_any()) {
        push(set, ConstraintOp::GreaterEq, low.value().floor());
    }
    const auto& h = high.value();
    if (h.is_any()) return ok_status();
    if (h.is_full()) {
        push(set, ConstraintOp::LessEq, h.floor());
    } else {
        push(set, ConstraintOp::Less, x_range_ceiling(h));
    }
    return ok_status();
}

static Result<ConstraintSet> parse_set(const std::string& text,
                                       const std::string& whole) {
    std::string normalized = text;
    std::replace(normalized.begin(), normalized.end(), ',', ' ');
    std::replace(normalized.begin(), normalized.end(), '\t', ' ');

    std::vector<std::string> raw;
    std::istringstream stream(normalized);
    std::string tok;
    while (stream >> tok) raw.push_back(tok);

    ConstraintSet set;

    if (raw.size() == 3 && raw[1] == "-") {
        auto st = parse_hyphen(raw[0], raw[2], set);
        if (st.is_err()) return std::move(st).error();
        return Result<ConstraintSet>::ok(std::move(set));
    }

    // Glue a detached operator to its operand: ">= 1.2.3"
    std::vector<std::string> tokens;
    for (size_t i = 0; i < raw.size(); ++i) {
        if (is_operator_only(raw[i])) {
            if (i + 1 >= raw.size()) {
                return NoduleError{NoduleError::InvalidRange,
                    "dangling operator '" + raw[i] + "' in range '" + whole + "'"};
            }
            tokens.push_back(raw[i] + raw[i + 1]);
            ++i;
        } else {
            tokens.push_back(raw[i]);
        }
    }

    for (const auto& t : tokens) {
        auto st = parse_simple(t, set);
        if (st.is_err()) {
            return NoduleError{NoduleError::InvalidRange,
                "invalid range '" + whole + "': " + st.error().message,
                "expected e.g. ^1.2.3, ~1.2, >=1.0.0 <2.0.0, 1.x or 1.0.0 - 2.0.0"};
        }
    }

    return Result<ConstraintSet>::ok(std::move(set));
}

// ---------------------------------------------------------------------------
// VersionReq
// ---------------------------------------------------------------------------

Result<VersionReq> VersionReq::parse(const std::string& s) {
    VersionReq req;

    size_t start = 0;
    while (true) {
        size_t bar = s.find("||", start);
        std::string part = s.substr(start, bar == std::string::npos
                                               ? std::string::npos
                                               : bar - start);
        auto set = parse_set(part, s);
        if (set.is_err()) return std::move(set).error();
        req.sets.push_back(std::move(set).value());

        if (bar == std::string::npos) break;
        start = bar + 2;
    }

    return Result<VersionReq>::ok(std::move(req));
}

bool VersionReq::matches(const Version& v) const {
    return std::any_of(sets.begin(), sets.end(),
        [&](const ConstraintSet& set) { return set.matches(v); });
}

std::string VersionReq::to_string() const {
    std::string s;
    for (size_t i = 0; i < sets.size(); ++i) {
        if (i > 0) s += " || ";
        s += sets[i].to_string();
    }
    return s;
}

} // namespace nodule
