#pragma once

#include <nodule/result.hpp>
#include <nlohmann/json_fwd.hpp>
#include <map>
#include <string>

namespace nodule {

// name -> semver range, as written by a manifest, lock entry or registry.
// Ordered so sibling dependencies are always processed by name.
using DependencyMap = std::map<std::string, std::string>;

// Read a JSON object of string values. Any other shape is an error with the
// given code, naming `where` in the message.
Result<DependencyMap> dependency_map_from_json(const nlohmann::json& j,
                                               const std::string& where,
                                               NoduleError::Code code);

nlohmann::json dependency_map_to_json(const DependencyMap& deps);

} // namespace nodule
