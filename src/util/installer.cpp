#include <nodule/installer.hpp>
#include <nodule/integrity.hpp>
#include <nodule/log.hpp>

namespace fs = std::filesystem;

namespace nodule {

Installer::Installer(Transport& transport, Extractor& extractor)
    : transport_(transport), extractor_(extractor) {}

Status Installer::fetch_and_install(const std::string& url,
                                    const std::string& package_name,
                                    const std::optional<std::string>& expected_integrity,
                                    const fs::path& target_dir) {
    log::status("Fetching", "%s (%s)", package_name.c_str(), url.c_str());
    ++fetches_;

    auto bytes = transport_.get(url, "");
    if (bytes.is_err()) return std::move(bytes).error();

    if (expected_integrity) {
        NODULE_TRY(verify_integrity(*expected_integrity, bytes.value(), package_name));
        log::debug("integrity check passed for %s", package_name.c_str());
    } else {
        log::warn("no integrity digest for %s, skipping verification",
                  package_name.c_str());
    }

    fs::path dest = target_dir / package_name;
    auto st = extractor_.extract(bytes.value(), dest);
    if (st.is_err()) {
        return std::move(st).error().with_context(package_name);
    }

    log::debug("unpacked %s into %s", package_name.c_str(), dest.string().c_str());
    return ok_status();
}

} // namespace nodule
