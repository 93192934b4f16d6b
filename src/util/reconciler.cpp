#include <nodule/reconciler.hpp>
#include <nodule/log.hpp>
#include <nodule/name.hpp>
#include <nodule/resolver.hpp>

#include <algorithm>

namespace fs = std::filesystem;

namespace nodule {

namespace {

// Pushes (name, version) for the duration of one package's install
class ActivePathGuard {
public:
    ActivePathGuard(std::vector<std::pair<std::string, std::string>>& path,
                    const std::string& name, const std::string& version)
        : path_(path) {
        path_.emplace_back(name, version);
    }
    ~ActivePathGuard() { path_.pop_back(); }

    ActivePathGuard(const ActivePathGuard&) = delete;
    ActivePathGuard& operator=(const ActivePathGuard&) = delete;

private:
    std::vector<std::pair<std::string, std::string>>& path_;
};

std::optional<std::string> digest_or_none(const std::string& integrity) {
    if (integrity.empty()) return std::nullopt;
    return integrity;
}

std::string describe_path(const std::vector<std::pair<std::string, std::string>>& path,
                          const std::string& name, const std::string& version) {
    std::string s;
    for (const auto& [n, v] : path) {
        s += n + "@" + v + " -> ";
    }
    return s + name + "@" + version;
}

} // namespace

// ---------------------------------------------------------------------------
// Constructor
// ---------------------------------------------------------------------------

Reconciler::Reconciler(RegistryClient& registry, Installer& installer,
                       ReconcileOptions options)
    : registry_(registry), installer_(installer), options_(std::move(options)) {}

// ---------------------------------------------------------------------------
// reconcile(): top level
// ---------------------------------------------------------------------------

Status Reconciler::reconcile(const DependencyMap& deps, LockFile& lock,
                             const fs::path& install_root) {
    if (!options_.keep_going) {
        return reconcile_level(deps, lock, install_root);
    }

    for (const auto& [name, range] : deps) {
        auto st = reconcile_one(name, range, lock, install_root);
        if (st.is_err()) {
            log::error("%s", st.error().format().c_str());
            stats_.failed.push_back(name);
        }
    }

    if (!stats_.failed.empty()) {
        std::string names;
        for (const auto& n : stats_.failed) {
            if (!names.empty()) names += ", ";
            names += n;
        }
        return NoduleError{NoduleError::Dependency,
            std::to_string(stats_.failed.size()) + " of " +
            std::to_string(deps.size()) + " dependencies failed to install: " + names};
    }
    return ok_status();
}

Status Reconciler::reconcile_level(const DependencyMap& deps, LockFile& lock,
                                   const fs::path& install_root) {
    for (const auto& [name, range] : deps) {
        NODULE_TRY(reconcile_one(name, range, lock, install_root));
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// reconcile_one(): reuse vs. fresh resolution
// ---------------------------------------------------------------------------

Status Reconciler::reconcile_one(const std::string& name, const std::string& range,
                                 LockFile& lock, const fs::path& install_root) {
    auto pkg = PkgName::parse(name);
    if (pkg.is_err()) return std::move(pkg).error();

    const LockEntry* locked = lock.find(name);
    if (locked) {
        bool hit = false;
        if (range == locked->version) {
            hit = true;
        } else {
            auto ok = satisfies(range, locked->version);
            if (ok.is_err()) {
                if (ok.error().code == NoduleError::InvalidRange) {
                    return std::move(ok).error().with_context(name);
                }
                log::warn("lock entry for %s has unparseable version '%s', re-resolving",
                          name.c_str(), locked->version.c_str());
            } else {
                hit = ok.value();
            }
        }

        if (hit) {
            // Copy: nested installs may overwrite this entry
            LockEntry entry = *locked;
            return install_locked(name, entry, lock, install_root);
        }
        log::debug("locked %s@%s does not satisfy '%s'",
                   name.c_str(), locked->version.c_str(), range.c_str());
    }

    return install_fresh(name, range, lock, install_root);
}

// ---------------------------------------------------------------------------
// install_locked(): lock hit, registry untouched
// ---------------------------------------------------------------------------

Status Reconciler::install_locked(const std::string& name, const LockEntry& entry,
                                  LockFile& lock, const fs::path& install_root) {
    if (on_active_path(name, entry.version)) {
        if (options_.cycles == CyclePolicy::Error) {
            return NoduleError{NoduleError::Cycle,
                "dependency cycle: " + describe_path(active_, name, entry.version)};
        }
        log::debug("cycle at %s@%s, using the ancestor copy",
                   name.c_str(), entry.version.c_str());
        ++stats_.cycles_skipped;
        return ok_status();
    }
    ActivePathGuard guard(active_, name, entry.version);

    std::string id = name + "@" + entry.version;
    log::status("Reusing", "%s", id.c_str());

    auto st = installer_.fetch_and_install(entry.resolved_url, name,
                                           digest_or_none(entry.integrity),
                                           install_root);
    if (st.is_err()) return std::move(st).error().with_context(id);

    if (entry.dependencies && !entry.dependencies->empty()) {
        auto nested = reconcile_level(*entry.dependencies, lock,
                                      nested_root(install_root, name));
        if (nested.is_err()) return std::move(nested).error().with_context(id);
    }

    ++stats_.reused;
    return ok_status();
}

// ---------------------------------------------------------------------------
// install_fresh(): registry resolution, then lock update
// ---------------------------------------------------------------------------

Status Reconciler::install_fresh(const std::string& name, const std::string& range,
                                 LockFile& lock, const fs::path& install_root) {
    log::status("Resolving", "%s@%s", name.c_str(), range.c_str());

    auto packument = registry_.get_versions(name);
    if (packument.is_err()) return std::move(packument).error().with_context(name);

    auto chosen = resolve_version(range, packument.value().version_strings());
    if (chosen.is_err()) {
        return std::move(chosen).error().with_context(name + "@" + range);
    }

    const VersionRecord* record = packument.value().find(chosen.value());
    if (!record) {
        return NoduleError{NoduleError::Registry,
            "registry listed " + name + "@" + chosen.value() + " without metadata"};
    }

    if (on_active_path(name, record->version)) {
        if (options_.cycles == CyclePolicy::Error) {
            return NoduleError{NoduleError::Cycle,
                "dependency cycle: " + describe_path(active_, name, record->version)};
        }
        log::debug("cycle at %s@%s, using the ancestor copy",
                   name.c_str(), record->version.c_str());
        ++stats_.cycles_skipped;
        return ok_status();
    }
    ActivePathGuard guard(active_, name, record->version);

    std::string id = name + "@" + record->version;
    log::debug("matched %s for '%s'", id.c_str(), range.c_str());

    auto st = installer_.fetch_and_install(record->tarball, name,
                                           digest_or_none(record->integrity),
                                           install_root);
    if (st.is_err()) return std::move(st).error().with_context(id);

    if (record->dependencies && !record->dependencies->empty()) {
        auto nested = reconcile_level(*record->dependencies, lock,
                                      nested_root(install_root, name));
        if (nested.is_err()) return std::move(nested).error().with_context(id);
    }

    LockEntry entry;
    entry.version = record->version;
    entry.resolved_url = record->tarball;
    entry.integrity = record->integrity;
    entry.dependencies = record->dependencies;
    lock.upsert(name, std::move(entry));

    ++stats_.resolved;
    return ok_status();
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

bool Reconciler::on_active_path(const std::string& name,
                                const std::string& version) const {
    return std::find(active_.begin(), active_.end(),
                     std::make_pair(name, version)) != active_.end();
}

fs::path Reconciler::nested_root(const fs::path& install_root,
                                 const std::string& name) const {
    return install_root / name / options_.modules_dir;
}

} // namespace nodule
