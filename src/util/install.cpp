#include <nodule/install.hpp>
#include <nodule/lockfile.hpp>
#include <nodule/log.hpp>
#include <nodule/manifest.hpp>

namespace fs = std::filesystem;

namespace nodule {

Result<fs::path> find_project_root(const fs::path& start_dir,
                                   const std::string& manifest_name) {
    std::error_code ec;
    fs::path dir = fs::canonical(start_dir, ec);
    if (ec) {
        dir = fs::absolute(start_dir, ec);
        if (ec) {
            return NoduleError{NoduleError::IO,
                "cannot resolve path: " + start_dir.string()};
        }
    }

    while (true) {
        std::string name = manifest_name;
        std::string local = project_config_path(dir);
        if (fs::exists(local, ec)) {
            auto layer = ConfigLayer::load(local);
            if (layer.is_err()) return std::move(layer).error();
            if (layer.value().manifest) name = *layer.value().manifest;
        }

        if (fs::exists(dir / name, ec)) {
            return Result<fs::path>::ok(dir);
        }

        fs::path parent = dir.parent_path();
        if (parent == dir) {
            return NoduleError{NoduleError::Manifest,
                "no " + manifest_name + " found in " + start_dir.string() +
                " or any parent directory"};
        }
        dir = parent;
    }
}

Result<InstallReport> run_install(const fs::path& project_dir,
                                  const Config& config,
                                  RegistryClient& registry,
                                  Installer& installer) {
    std::string manifest_path = (project_dir / config.manifest).string();
    std::string lock_path = (project_dir / config.lockfile).string();

    auto manifest = Manifest::load(manifest_path);
    if (manifest.is_err()) return std::move(manifest).error();

    auto lock = LockFile::load(lock_path);
    if (lock.is_err()) return std::move(lock).error();

    InstallReport report;
    report.direct = manifest.value().dependencies.size();

    Status outcome = ok_status();
    if (manifest.value().dependencies.empty()) {
        log::info("no dependencies in %s", manifest_path.c_str());
    } else {
        ReconcileOptions options;
        options.modules_dir = config.modules_dir;
        options.cycles = config.cycles;
        options.keep_going = config.keep_going;

        Reconciler reconciler(registry, installer, options);
        outcome = reconciler.reconcile(manifest.value().dependencies,
                                       lock.value(),
                                       project_dir / config.modules_dir);
        report.stats = reconciler.stats();
    }

    auto saved = lock.value().save(lock_path);
    if (saved.is_err()) {
        log::error("failed to write lock file: %s", saved.error().message.c_str());
        if (outcome.is_ok()) return std::move(saved).error();
    } else {
        report.lock_written = true;
        log::status("Wrote", "%s (%zu entries)", lock_path.c_str(), lock.value().size());
    }

    if (outcome.is_err()) return std::move(outcome).error();
    return Result<InstallReport>::ok(std::move(report));
}

} // namespace nodule
