// nodule: install the dependencies declared in ./package.json (or the
// configured manifest, in the nearest parent that has one) into a nested node_modules tree, recording
// every resolution in dep-lock.json.

#include <nodule/archive.hpp>
#include <nodule/config.hpp>
#include <nodule/http.hpp>
#include <nodule/install.hpp>
#include <nodule/log.hpp>

#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;
using namespace nodule;

static int fail(const NoduleError& e) {
    std::fprintf(stderr, "%s\n", e.format().c_str());
    return 1;
}

int main() {
    // Environment first so NODULE_LOG applies to config discovery too
    auto env = ConfigLayer::from_env();
    if (env.is_err()) return fail(env.error());
    if (env.value().log_level) log::set_level(*env.value().log_level);

    auto global = Config::load_global();
    if (global.is_err()) return fail(global.error());

    auto root = find_project_root(fs::current_path(), global.value().manifest);
    if (root.is_err()) return fail(root.error());

    auto config = Config::load(root.value());
    if (config.is_err()) return fail(config.error());
    const Config& cfg = config.value();

    log::set_level(cfg.log_level);
    if (cfg.color) log::set_color_enabled(*cfg.color);

    CurlGlobal curl;
    if (!curl.ok()) {
        return fail(NoduleError{NoduleError::Network, "failed to initialize libcurl"});
    }

    HttpOptions http;
    http.timeout_seconds = cfg.timeout_seconds;
    http.user_agent = cfg.user_agent;
    CurlTransport transport(http);

    NpmRegistryClient registry(transport, cfg.registry_url);
    TarGzExtractor extractor(cfg.strip_components);
    Installer installer(transport, extractor);

    auto report = run_install(root.value(), cfg, registry, installer);
    if (report.is_err()) return fail(report.error());

    const auto& stats = report.value().stats;
    log::info("%zu direct dependencies: %zu resolved, %zu reused from lock",
              report.value().direct, stats.resolved, stats.reused);
    return 0;
}
