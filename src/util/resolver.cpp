#include <nodule/resolver.hpp>
#include <nodule/log.hpp>

#include <algorithm>

namespace nodule {

Result<std::string> resolve_version(const std::string& range,
                                    const std::vector<std::string>& available) {
    // Pinned fast path
    if (std::find(available.begin(), available.end(), range) != available.end()) {
        return Result<std::string>::ok(range);
    }

    auto req = VersionReq::parse(range);
    if (req.is_err()) return std::move(req).error();

    struct Candidate {
        Version version;
        const std::string* published;
    };
    std::vector<Candidate> matching;

    for (const auto& s : available) {
        auto v = Version::parse(s);
        if (v.is_err()) {
            log::trace("skipping non-semver published version '%s'", s.c_str());
            continue;
        }
        if (req.value().matches(v.value())) {
            matching.push_back({std::move(v).value(), &s});
        }
    }

    if (matching.empty()) {
        return NoduleError{NoduleError::NotFound,
            "no published version satisfies '" + range + "'",
            std::to_string(available.size()) + " version(s) considered"};
    }

    std::stable_sort(matching.begin(), matching.end(),
        [](const Candidate& a, const Candidate& b) {
            return a.version < b.version;
        });

    return Result<std::string>::ok(*matching.back().published);
}

Result<bool> satisfies(const std::string& range, const std::string& version) {
    auto req = VersionReq::parse(range);
    if (req.is_err()) return std::move(req).error();

    auto v = Version::parse(version);
    if (v.is_err()) return std::move(v).error();

    return Result<bool>::ok(req.value().matches(v.value()));
}

} // namespace nodule
