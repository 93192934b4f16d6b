#pragma once

#include <nodule/result.hpp>
#include <nodule/dependency.hpp>
#include <nodule/http.hpp>
#include <nodule/name.hpp>

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nodule {

// One published version of a package
struct VersionRecord {
    std::string version;
    std::string tarball;
    std::string integrity;   // empty when the registry publishes none
    std::optional<DependencyMap> dependencies;
};

// Registry metadata document for one package
struct Packument {
    std::string name;
    std::map<std::string, VersionRecord> versions;  // keyed as published

    std::vector<std::string> version_strings() const;
    const VersionRecord* find(const std::string& version) const;
};

// Parse registry JSON: { "versions": { "<v>": { "version", "dist": {
// "tarball", "integrity" }, "dependencies" } } }. Versions without a
// tarball are dropped; malformed JSON or a missing "versions" object is a
// Registry error.
Result<Packument> parse_packument(const std::string& json_text,
                                  const std::string& name);

class RegistryClient {
public:
    virtual ~RegistryClient() = default;

    // All published versions of `name`. Network errors are not retried.
    virtual Result<Packument> get_versions(const std::string& name) = 0;
};

// npm-compatible registry over a Transport. Packuments are memoized for
// the lifetime of the client, so one run sees one immutable view.
class NpmRegistryClient : public RegistryClient {
public:
    static constexpr const char* DEFAULT_URL = "https://registry.npmjs.org";

    NpmRegistryClient(Transport& transport, std::string base_url = DEFAULT_URL);

    Result<Packument> get_versions(const std::string& name) override;

    std::string packument_url(const PkgName& name) const;
    size_t request_count() const { return requests_; }

private:
    Transport& transport_;
    std::string base_url_;
    std::unordered_map<std::string, Packument> cache_;
    size_t requests_ = 0;
};

} // namespace nodule
