#pragma once

#include <nodule/result.hpp>
#include <string>

namespace nodule {

// npm package name: "name" or "@scope/name". Validated before it is ever
// joined into an install path.
struct PkgName {
    static Result<PkgName> parse(const std::string& raw);

    const std::string& raw() const;
    const std::string& scope() const;   // without '@', empty if unscoped
    const std::string& base() const;

    bool is_scoped() const { return !scope_.empty(); }

    // Path segment form for registry URLs: "@scope%2fname"
    std::string url_encoded() const;

    bool operator==(const PkgName& o) const;
    bool operator!=(const PkgName& o) const;

private:
    std::string raw_;
    std::string scope_;
    std::string base_;
};

} // namespace nodule
