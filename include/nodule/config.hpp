#pragma once

#include <nodule/result.hpp>
#include <nodule/log.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace nodule {

// What to do when a package reappears on its own ancestor path
enum class CyclePolicy {
    Skip,    // leave it to the ancestor's copy
    Error,   // fail with a Cycle error
};

Result<CyclePolicy> parse_cycle_policy(const std::string& s);
const char* cycle_policy_name(CyclePolicy p);

// One TOML file (or the environment): only keys that were present are set
struct ConfigLayer {
    std::optional<std::string> registry_url;
    std::optional<long> timeout_seconds;
    std::optional<std::string> user_agent;

    std::optional<std::string> manifest;
    std::optional<std::string> lockfile;
    std::optional<std::string> modules_dir;
    std::optional<int> strip_components;
    std::optional<bool> keep_going;
    std::optional<CyclePolicy> cycles;

    std::optional<log::Level> log_level;
    std::optional<bool> color;

    static Result<ConfigLayer> parse(const std::string& toml_str,
                                     const std::string& origin = "");
    static Result<ConfigLayer> load(const std::string& path);

    // NODULE_REGISTRY, NODULE_LOG
    static Result<ConfigLayer> from_env();
};

// Effective configuration: defaults, then global, project and environment
// layers, later layers winning key by key.
struct Config {
    std::string registry_url = "https://registry.npmjs.org";
    long timeout_seconds = 0;
    std::string user_agent = "nodule/0.1.0";

    std::string manifest = "package.json";
    std::string lockfile = "dep-lock.json";
    std::string modules_dir = "node_modules";
    int strip_components = 1;
    bool keep_going = false;
    CyclePolicy cycles = CyclePolicy::Skip;

    log::Level log_level = log::Info;
    std::optional<bool> color;   // unset: detect from the terminal

    void apply(const ConfigLayer& layer);

    // ~/.nodule/config.toml, <project>/nodule.toml, environment.
    // Missing files are skipped; malformed ones are Config errors.
    static Result<Config> load(const std::filesystem::path& project_dir);

    // As load(), without a project layer. Used before the root is known.
    static Result<Config> load_global();
};

// ~/.nodule/config.toml, or "" when HOME is unset
std::string global_config_path();

// <project_dir>/nodule.toml
std::string project_config_path(const std::filesystem::path& project_dir);

} // namespace nodule
