#include <nodule/manifest.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace nodule {

Result<Manifest> Manifest::parse(const std::string& json_text,
                                 const std::string& origin) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::exception& e) {
        return NoduleError{NoduleError::Manifest,
            std::string("manifest is not valid JSON: ") + e.what(),
            "", origin, 0};
    }

    if (!doc.is_object()) {
        return NoduleError{NoduleError::Manifest,
            "manifest must be a JSON object", "", origin, 0};
    }

    Manifest m;
    auto name = doc.find("name");
    if (name != doc.end() && name->is_string()) {
        m.name = name->get<std::string>();
    }
    auto version = doc.find("version");
    if (version != doc.end() && version->is_string()) {
        m.version = version->get<std::string>();
    }

    auto deps = doc.find("dependencies");
    if (deps != doc.end() && !deps->is_null()) {
        auto parsed = dependency_map_from_json(*deps, "manifest",
                                               NoduleError::Manifest);
        if (parsed.is_err()) {
            NoduleError e = std::move(parsed).error();
            e.file = origin;
            return e;
        }
        m.dependencies = std::move(parsed).value();
    }

    return Result<Manifest>::ok(std::move(m));
}

Result<Manifest> Manifest::load(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return NoduleError{NoduleError::Manifest,
            "cannot open manifest: " + path,
            "run nodule from a directory containing package.json"};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Manifest::parse(ss.str(), path);
}

} // namespace nodule
