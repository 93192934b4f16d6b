#pragma once

#include <nodule/result.hpp>
#include <nodule/http.hpp>
#include <nodule/archive.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace nodule {

// Download an artifact, verify it, unpack it to <target_dir>/<name>.
// Nothing is extracted unless verification passed or the caller supplied
// no digest at all. Partially extracted files are not cleaned up on error.
class Installer {
public:
    Installer(Transport& transport, Extractor& extractor);

    Status fetch_and_install(const std::string& url,
                             const std::string& package_name,
                             const std::optional<std::string>& expected_integrity,
                             const std::filesystem::path& target_dir);

    size_t fetch_count() const { return fetches_; }

private:
    Transport& transport_;
    Extractor& extractor_;
    size_t fetches_ = 0;
};

} // namespace nodule
