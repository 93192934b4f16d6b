#include <nodule/registry.hpp>
#include <nodule/log.hpp>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace nodule {

// Abbreviated metadata: versions, dist and dependencies only
static const char CORGI_ACCEPT[] =
    "application/vnd.npm.install-v1+json; q=1.0, application/json; q=0.8, */*";

std::vector<std::string> Packument::version_strings() const {
    std::vector<std::string> out;
    out.reserve(versions.size());
    for (const auto& [v, rec] : versions) {
        out.push_back(v);
    }
    return out;
}

const VersionRecord* Packument::find(const std::string& version) const {
    auto it = versions.find(version);
    return it == versions.end() ? nullptr : &it->second;
}

static Result<VersionRecord> parse_record(const std::string& key,
                                          const json& rec,
                                          const std::string& where) {
    if (!rec.is_object()) {
        return NoduleError{NoduleError::Registry,
            where + ": version entry '" + key + "' is not an object"};
    }

    VersionRecord out;
    out.version = key;
    auto v = rec.find("version");
    if (v != rec.end() && v->is_string()) {
        out.version = v->get<std::string>();
    }

    auto dist = rec.find("dist");
    if (dist != rec.end() && dist->is_object()) {
        auto tarball = dist->find("tarball");
        if (tarball != dist->end() && tarball->is_string()) {
            out.tarball = tarball->get<std::string>();
        }
        auto integrity = dist->find("integrity");
        if (integrity != dist->end() && integrity->is_string()) {
            out.integrity = integrity->get<std::string>();
        }
    }

    auto deps = rec.find("dependencies");
    if (deps != rec.end() && !deps->is_null()) {
        auto parsed = dependency_map_from_json(*deps, where + "@" + key,
                                               NoduleError::Registry);
        if (parsed.is_err()) return std::move(parsed).error();
        out.dependencies = std::move(parsed).value();
    }

    return Result<VersionRecord>::ok(std::move(out));
}

Result<Packument> parse_packument(const std::string& json_text,
                                  const std::string& name) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::exception& e) {
        return NoduleError{NoduleError::Registry,
            "unparseable registry response for '" + name + "': " + e.what()};
    }

    auto versions = doc.find("versions");
    if (!doc.is_object() || versions == doc.end() || !versions->is_object()) {
        return NoduleError{NoduleError::Registry,
            "registry response for '" + name + "' has no 'versions' object"};
    }

    Packument p;
    p.name = name;
    for (auto it = versions->begin(); it != versions->end(); ++it) {
        auto rec = parse_record(it.key(), it.value(), name);
        if (rec.is_err()) return std::move(rec).error();
        if (rec.value().tarball.empty()) {
            log::trace("%s@%s has no tarball, ignoring", name.c_str(), it.key().c_str());
            continue;
        }
        p.versions.emplace(it.key(), std::move(rec).value());
    }

    return Result<Packument>::ok(std::move(p));
}

NpmRegistryClient::NpmRegistryClient(Transport& transport, std::string base_url)
    : transport_(transport), base_url_(std::move(base_url)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string NpmRegistryClient::packument_url(const PkgName& name) const {
    return base_url_ + "/" + name.url_encoded();
}

Result<Packument> NpmRegistryClient::get_versions(const std::string& name) {
    auto cached = cache_.find(name);
    if (cached != cache_.end()) {
        log::trace("packument cache hit: %s", name.c_str());
        return Result<Packument>::ok(cached->second);
    }

    auto pkg = PkgName::parse(name);
    if (pkg.is_err()) return std::move(pkg).error();

    std::string url = packument_url(pkg.value());
    log::debug("querying registry: %s", url.c_str());
    ++requests_;

    auto body = transport_.get(url, CORGI_ACCEPT);
    if (body.is_err()) return std::move(body).error();

    auto parsed = parse_packument(body.value(), name);
    if (parsed.is_err()) return std::move(parsed).error();

    cache_.emplace(name, parsed.value());
    return parsed;
}

} // namespace nodule
