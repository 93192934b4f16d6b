#pragma once

#include <nodule/archive.hpp>
#include <nodule/http.hpp>
#include <nodule/installer.hpp>
#include <nodule/integrity.hpp>
#include <nodule/lockfile.hpp>
#include <nodule/registry.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// RAII temp directory
// ---------------------------------------------------------------------------

struct TempDir {
    fs::path path;

    explicit TempDir(const std::string& tag = "test") {
        const char* src = std::getenv("NODULE_SOURCE_DIR");
        fs::path base = src ? fs::path(src) / "build" : fs::temp_directory_path();
        static unsigned counter = 0;
        path = base / ("nodule_" + tag + "_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count()) +
            "_" + std::to_string(counter++));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    fs::path write_file(const std::string& rel, const std::string& content) const {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full, std::ios::binary);
        f << content;
        return full;
    }
};

inline std::string read_file(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// Relative path -> bytes for every regular file under root
inline std::map<std::string, std::string> snapshot_tree(const fs::path& root) {
    std::map<std::string, std::string> files;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        files[fs::relative(entry.path(), root).generic_string()] = read_file(entry.path());
    }
    return files;
}

// ---------------------------------------------------------------------------
// In-memory transport: URL -> body
// ---------------------------------------------------------------------------

class FakeTransport : public nodule::Transport {
public:
    std::map<std::string, std::string> bodies;
    std::set<std::string> failing;
    std::vector<std::string> requests;
    std::vector<std::string> accepts;

    nodule::Result<std::string> get(const std::string& url,
                                    const std::string& accept) override {
        requests.push_back(url);
        accepts.push_back(accept);
        if (failing.count(url)) {
            return nodule::NoduleError{nodule::NoduleError::Network,
                "GET " + url + " failed: connection refused"};
        }
        auto it = bodies.find(url);
        if (it == bodies.end()) {
            return nodule::NoduleError{nodule::NoduleError::Network,
                "GET " + url + " failed: HTTP 404"};
        }
        return nodule::Result<std::string>::ok(it->second);
    }
};

// ---------------------------------------------------------------------------
// Extractor that records what it was asked to unpack
// ---------------------------------------------------------------------------

class FakeExtractor : public nodule::Extractor {
public:
    static constexpr const char* CONTENT_FILE = "artifact.bin";

    std::vector<fs::path> destinations;

    nodule::Status extract(const std::string& bytes, const fs::path& dest) override {
        destinations.push_back(dest);
        std::error_code ec;
        fs::create_directories(dest, ec);
        if (ec) {
            return nodule::NoduleError{nodule::NoduleError::Extract,
                "cannot create " + dest.string()};
        }
        std::ofstream out(dest / CONTENT_FILE, std::ios::binary | std::ios::trunc);
        out << bytes;
        return nodule::ok_status();
    }
};

// ---------------------------------------------------------------------------
// Registry backed by a map of packuments, counting every query
// ---------------------------------------------------------------------------

class FakeRegistry : public nodule::RegistryClient {
public:
    std::map<std::string, nodule::Packument> packages;
    std::vector<std::string> queried;

    nodule::Result<nodule::Packument> get_versions(const std::string& name) override {
        queried.push_back(name);
        auto it = packages.find(name);
        if (it == packages.end()) {
            return nodule::NoduleError{nodule::NoduleError::Network,
                "GET https://registry.test/" + name + " failed: HTTP 404"};
        }
        return nodule::Result<nodule::Packument>::ok(it->second);
    }

    size_t calls() const { return queried.size(); }
};

// ---------------------------------------------------------------------------
// Registry + transport + installer wired together
// ---------------------------------------------------------------------------

struct InstallWorld {
    FakeTransport transport;
    FakeExtractor extractor;
    FakeRegistry registry;
    nodule::Installer installer{transport, extractor};

    static std::string tarball_url(const std::string& name, const std::string& version) {
        return "https://registry.test/" + name + "/-/" + name + "-" + version + ".tgz";
    }

    static std::string tarball_bytes(const std::string& name, const std::string& version) {
        return "tarball of " + name + "@" + version;
    }

    // Make name@version resolvable and downloadable. Returns its record.
    nodule::VersionRecord publish(const std::string& name, const std::string& version,
                                  std::optional<nodule::DependencyMap> deps = std::nullopt) {
        nodule::VersionRecord rec;
        rec.version = version;
        rec.tarball = tarball_url(name, version);
        rec.integrity = nodule::Integrity::of(tarball_bytes(name, version));
        rec.dependencies = std::move(deps);

        auto& doc = registry.packages[name];
        doc.name = name;
        doc.versions[version] = rec;
        transport.bodies[rec.tarball] = tarball_bytes(name, version);
        return rec;
    }

    // Lock entry matching what publish() serves
    static nodule::LockEntry entry_for(const nodule::VersionRecord& rec) {
        nodule::LockEntry e;
        e.version = rec.version;
        e.resolved_url = rec.tarball;
        e.integrity = rec.integrity;
        e.dependencies = rec.dependencies;
        return e;
    }
};
