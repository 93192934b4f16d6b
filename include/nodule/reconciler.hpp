#pragma once

#include <nodule/result.hpp>
#include <nodule/config.hpp>
#include <nodule/dependency.hpp>
#include <nodule/installer.hpp>
#include <nodule/lockfile.hpp>
#include <nodule/registry.hpp>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace nodule {

struct ReconcileOptions {
    std::string modules_dir = "node_modules";  // nested per package
    CyclePolicy cycles = CyclePolicy::Skip;
    bool keep_going = false;                   // isolate top-level failures
};

struct ReconcileStats {
    size_t reused = 0;          // installed from a satisfying lock entry
    size_t resolved = 0;        // resolved against the registry
    size_t cycles_skipped = 0;
    std::vector<std::string> failed;   // top-level names, keep_going only
};

// Walks a dependency set and everything beneath it, deciding per package
// whether the lock entry can be reused or the registry must be consulted,
// installing each into a strictly nested tree:
//
//   <root>/<a>/                      direct dependency
//   <root>/<a>/node_modules/<b>/     b as required by a
//
// Lock entries are only written for freshly resolved packages, after their
// whole subtree installed. The first failure aborts the walk; entries
// already written stay in the lock.
class Reconciler {
public:
    Reconciler(RegistryClient& registry, Installer& installer,
               ReconcileOptions options = {});

    Status reconcile(const DependencyMap& deps, LockFile& lock,
                     const std::filesystem::path& install_root);

    const ReconcileStats& stats() const { return stats_; }

private:
    Status reconcile_level(const DependencyMap& deps, LockFile& lock,
                           const std::filesystem::path& install_root);

    Status reconcile_one(const std::string& name, const std::string& range,
                         LockFile& lock, const std::filesystem::path& install_root);

    Status install_locked(const std::string& name, const LockEntry& entry,
                          LockFile& lock, const std::filesystem::path& install_root);

    Status install_fresh(const std::string& name, const std::string& range,
                         LockFile& lock, const std::filesystem::path& install_root);

    // True if (name, version) is already being installed further up
    bool on_active_path(const std::string& name, const std::string& version) const;

    std::filesystem::path nested_root(const std::filesystem::path& install_root,
                                      const std::string& name) const;

    RegistryClient& registry_;
    Installer& installer_;
    ReconcileOptions options_;
    ReconcileStats stats_;
    std::vector<std::pair<std::string, std::string>> active_;
};

} // namespace nodule
