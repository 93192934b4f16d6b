#pragma once

#include <nodule/result.hpp>
#include <nodule/version.hpp>
#include <string>
#include <vector>

namespace nodule {

// Pick the published version a range resolves to.
//
//  1. A range string identical to a published version string wins outright,
//     even when it would not parse as a range.
//  2. Otherwise the range must parse (InvalidRange).
//  3. Published strings that are not valid semver are skipped.
//  4. The highest version satisfying the range is returned, spelled exactly
//     as it was published; none satisfying is NotFound.
Result<std::string> resolve_version(const std::string& range,
                                    const std::vector<std::string>& available);

// Single-version check used when reconciling against a lock entry.
// InvalidRange if the range is malformed, Version if the version is.
Result<bool> satisfies(const std::string& range, const std::string& version);

} // namespace nodule
