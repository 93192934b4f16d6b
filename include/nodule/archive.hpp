#pragma once

#include <nodule/result.hpp>
#include <filesystem>
#include <string>

namespace nodule {

// "Extract this byte stream into this directory"
class Extractor {
public:
    virtual ~Extractor() = default;

    // Creates `dest` and everything in the archive beneath it. Existing
    // files are overwritten. Failures are Extract errors.
    virtual Status extract(const std::string& bytes,
                           const std::filesystem::path& dest) = 0;
};

// gzip-compressed tar via libarchive. npm tarballs wrap their content in a
// single top-level directory ("package/"), dropped by strip_components = 1.
class TarGzExtractor : public Extractor {
public:
    explicit TarGzExtractor(int strip_components = 1);

    Status extract(const std::string& bytes,
                   const std::filesystem::path& dest) override;

private:
    int strip_components_;
};

// Remove the first `n` components of an archive member path. Returns an
// empty string when nothing is left. Fails on absolute paths and "..".
Result<std::string> strip_member_path(const std::string& member, int n);

} // namespace nodule
