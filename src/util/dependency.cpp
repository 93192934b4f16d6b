#include <nodule/dependency.hpp>
#include <nlohmann/json.hpp>

namespace nodule {

Result<DependencyMap> dependency_map_from_json(const nlohmann::json& j,
                                               const std::string& where,
                                               NoduleError::Code code) {
    if (!j.is_object()) {
        return NoduleError{code,
            where + ": 'dependencies' must be an object of name -> range"};
    }

    DependencyMap deps;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string()) {
            return NoduleError{code,
                where + ": range for '" + it.key() + "' must be a string"};
        }
        deps[it.key()] = it.value().get<std::string>();
    }
    return Result<DependencyMap>::ok(std::move(deps));
}

nlohmann::json dependency_map_to_json(const DependencyMap& deps) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, range] : deps) {
        j[name] = range;
    }
    return j;
}

} // namespace nodule
