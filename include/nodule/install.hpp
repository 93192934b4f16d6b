#pragma once

#include <nodule/result.hpp>
#include <nodule/config.hpp>
#include <nodule/installer.hpp>
#include <nodule/reconciler.hpp>
#include <nodule/registry.hpp>

#include <filesystem>

namespace nodule {

// Walk up from start_dir to the nearest directory holding its manifest:
// `manifest_name`, unless that directory's nodule.toml sets [install] manifest.
Result<std::filesystem::path> find_project_root(const std::filesystem::path& start_dir,
                                                const std::string& manifest_name);

struct InstallReport {
    size_t direct = 0;          // dependencies named by the manifest
    ReconcileStats stats;
    bool lock_written = false;
};

// One install run in project_dir:
//   1. load the manifest and lock file (failures abort before any fetch)
//   2. reconcile manifest dependencies into <project_dir>/<modules_dir>
//   3. write the lock file back, whatever happened in step 2
// The reconciliation error wins over a persistence error; a persistence
// error alone is still returned.
Result<InstallReport> run_install(const std::filesystem::path& project_dir,
                                  const Config& config,
                                  RegistryClient& registry,
                                  Installer& installer);

} // namespace nodule
