#include <nodule/config.hpp>

#include <toml++/toml.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace nodule {

Result<CyclePolicy> parse_cycle_policy(const std::string& s) {
    if (s == "skip") return Result<CyclePolicy>::ok(CyclePolicy::Skip);
    if (s == "error") return Result<CyclePolicy>::ok(CyclePolicy::Error);
    return NoduleError{NoduleError::Config,
        "unknown cycle policy '" + s + "'",
        "expected \"skip\" or \"error\""};
}

const char* cycle_policy_name(CyclePolicy p) {
    switch (p) {
        case CyclePolicy::Skip:  return "skip";
        case CyclePolicy::Error: return "error";
    }
    return "unknown";
}

static NoduleError config_error(const std::string& msg, const std::string& origin) {
    return NoduleError{NoduleError::Config, msg, "", origin, 0};
}

Result<ConfigLayer> ConfigLayer::parse(const std::string& toml_str,
                                       const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return NoduleError{NoduleError::Config,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", origin, static_cast<int>(e.source().begin.line)};
    }

    ConfigLayer layer;

    // [registry]
    if (auto reg = doc["registry"].as_table()) {
        if (auto v = (*reg)["url"].value<std::string>()) {
            if (v->empty()) return config_error("registry.url is empty", origin);
            layer.registry_url = *v;
        }
        if (auto v = (*reg)["timeout"].value<int64_t>()) {
            if (*v < 0) return config_error("registry.timeout must be >= 0", origin);
            layer.timeout_seconds = static_cast<long>(*v);
        }
        if (auto v = (*reg)["user-agent"].value<std::string>()) {
            layer.user_agent = *v;
        }
    }

    // [install]
    if (auto inst = doc["install"].as_table()) {
        if (auto v = (*inst)["manifest"].value<std::string>()) layer.manifest = *v;
        if (auto v = (*inst)["lockfile"].value<std::string>()) layer.lockfile = *v;
        if (auto v = (*inst)["modules-dir"].value<std::string>()) {
            if (v->empty()) return config_error("install.modules-dir is empty", origin);
            layer.modules_dir = *v;
        }
        if (auto v = (*inst)["strip-components"].value<int64_t>()) {
            if (*v < 0 || *v > 16) {
                return config_error("install.strip-components must be in 0..16", origin);
            }
            layer.strip_components = static_cast<int>(*v);
        }
        if (auto v = (*inst)["keep-going"].value<bool>()) layer.keep_going = *v;
        if (auto v = (*inst)["cycles"].value<std::string>()) {
            auto policy = parse_cycle_policy(*v);
            if (policy.is_err()) {
                NoduleError e = std::move(policy).error();
                e.file = origin;
                return e;
            }
            layer.cycles = policy.value();
        }
    }

    // [log]
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) {
                NoduleError e = std::move(lvl).error();
                e.file = origin;
                return e;
            }
            layer.log_level = lvl.value();
        }
        if (auto v = (*lg)["color"].value<bool>()) layer.color = *v;
    }

    return Result<ConfigLayer>::ok(std::move(layer));
}

Result<ConfigLayer> ConfigLayer::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return NoduleError{NoduleError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ConfigLayer::parse(ss.str(), path);
}

Result<ConfigLayer> ConfigLayer::from_env() {
    ConfigLayer layer;
    if (const char* reg = std::getenv("NODULE_REGISTRY")) {
        if (*reg) layer.registry_url = std::string(reg);
    }
    if (const char* lvl = std::getenv("NODULE_LOG")) {
        if (*lvl) {
            auto parsed = log::parse_level(lvl);
            if (parsed.is_err()) {
                return std::move(parsed).error().with_context("NODULE_LOG");
            }
            layer.log_level = parsed.value();
        }
    }
    return Result<ConfigLayer>::ok(std::move(layer));
}

void Config::apply(const ConfigLayer& layer) {
    if (layer.registry_url) registry_url = *layer.registry_url;
    if (layer.timeout_seconds) timeout_seconds = *layer.timeout_seconds;
    if (layer.user_agent) user_agent = *layer.user_agent;

    if (layer.manifest) manifest = *layer.manifest;
    if (layer.lockfile) lockfile = *layer.lockfile;
    if (layer.modules_dir) modules_dir = *layer.modules_dir;
    if (layer.strip_components) strip_components = *layer.strip_components;
    if (layer.keep_going) keep_going = *layer.keep_going;
    if (layer.cycles) cycles = *layer.cycles;

    if (layer.log_level) log_level = *layer.log_level;
    if (layer.color) color = layer.color;
}

static Result<Config> load_layers(const std::vector<std::string>& files) {
    Config cfg;

    std::error_code ec;
    for (const auto& path : files) {
        if (path.empty() || !fs::exists(path, ec)) continue;
        auto layer = ConfigLayer::load(path);
        if (layer.is_err()) return std::move(layer).error();
        cfg.apply(layer.value());
    }

    auto env = ConfigLayer::from_env();
    if (env.is_err()) return std::move(env).error();
    cfg.apply(env.value());

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const fs::path& project_dir) {
    return load_layers({global_config_path(), project_config_path(project_dir)});
}

Result<Config> Config::load_global() {
    return load_layers({global_config_path()});
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.nodule/config.toml";
}

std::string project_config_path(const fs::path& project_dir) {
    return (project_dir / "nodule.toml").string();
}

} // namespace nodule
