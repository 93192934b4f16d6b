#include <nodule/name.hpp>
#include <cctype>

namespace nodule {

static constexpr size_t MAX_NAME_LENGTH = 214;

static bool is_name_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    // Uppercase is only legal for legacy packages, but the registry still
    // serves them as dependencies (e.g. JSONStream)
    return std::isalnum(u) ||
           c == '-' || c == '.' || c == '_' || c == '~';
}

static Status check_segment(const std::string& seg, const std::string& raw) {
    if (seg.empty()) {
        return NoduleError{NoduleError::InvalidName,
            "empty name segment in '" + raw + "'"};
    }
    if (seg == "." || seg == "..") {
        return NoduleError{NoduleError::InvalidName,
            "invalid package name '" + raw + "'"};
    }
    if (seg[0] == '.' || seg[0] == '_') {
        return NoduleError{NoduleError::InvalidName,
            "invalid package name '" + raw + "'",
            "package names cannot start with '.' or '_'"};
    }
    for (char c : seg) {
        if (!is_name_char(c)) {
            return NoduleError{NoduleError::InvalidName,
                "invalid character '" + std::string(1, c) +
                "' in package name '" + raw + "'",
                "allowed: [A-Za-z0-9-._~], optionally prefixed by @scope/"};
        }
    }
    return ok_status();
}

Result<PkgName> PkgName::parse(const std::string& raw) {
    if (raw.empty()) {
        return NoduleError{NoduleError::InvalidName, "empty package name"};
    }
    if (raw.size() > MAX_NAME_LENGTH) {
        return NoduleError{NoduleError::InvalidName,
            "package name '" + raw + "' is longer than 214 characters"};
    }

    PkgName name;
    name.raw_ = raw;

    if (raw[0] == '@') {
        size_t slash = raw.find('/');
        if (slash == std::string::npos) {
            return NoduleError{NoduleError::InvalidName,
                "scoped package name '" + raw + "' is missing '/'",
                "expected @scope/name"};
        }
        name.scope_ = raw.substr(1, slash - 1);
        name.base_ = raw.substr(slash + 1);
        NODULE_TRY(check_segment(name.scope_, raw));
    } else {
        name.base_ = raw;
    }
    NODULE_TRY(check_segment(name.base_, raw));

    return Result<PkgName>::ok(std::move(name));
}

const std::string& PkgName::raw() const { return raw_; }
const std::string& PkgName::scope() const { return scope_; }
const std::string& PkgName::base() const { return base_; }

std::string PkgName::url_encoded() const {
    if (!is_scoped()) return base_;
    return "@" + scope_ + "%2f" + base_;
}

bool PkgName::operator==(const PkgName& o) const {
    return raw_ == o.raw_;
}

bool PkgName::operator!=(const PkgName& o) const {
    return !(*this == o);
}

} // namespace nodule
