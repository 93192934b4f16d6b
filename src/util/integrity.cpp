#include <nodule/integrity.hpp>
#include <nodule/base64.hpp>
#include <nodule/sha512.hpp>

namespace nodule {

static const char SUPPORTED_ALGORITHM[] = "sha512";

Result<Integrity> Integrity::parse(const std::string& s) {
    size_t dash = s.find('-');
    if (dash == std::string::npos || s.find('-', dash + 1) != std::string::npos) {
        return NoduleError{NoduleError::UnsupportedAlgorithm,
            "malformed integrity digest '" + s + "'",
            "expected '<algorithm>-<base64 hash>'"};
    }

    Integrity in;
    in.algorithm = s.substr(0, dash);
    in.digest = s.substr(dash + 1);

    if (in.algorithm != SUPPORTED_ALGORITHM) {
        return NoduleError{NoduleError::UnsupportedAlgorithm,
            "unsupported hash algorithm '" + in.algorithm + "' in '" + s + "'",
            "only sha512 digests are supported"};
    }

    return Result<Integrity>::ok(std::move(in));
}

std::string Integrity::of(const std::string& bytes) {
    auto digest = SHA512::hash(bytes);
    return std::string(SUPPORTED_ALGORITHM) + "-" +
           base64::encode(digest.data(), digest.size());
}

Status verify_integrity(const std::string& expected,
                        const std::string& content,
                        const std::string& subject) {
    auto parsed = Integrity::parse(expected);
    if (parsed.is_err()) {
        return std::move(parsed).error();
    }

    auto digest = SHA512::hash(content);
    std::string actual = base64::encode(digest.data(), digest.size());

    if (actual != parsed.value().digest) {
        std::string what = subject.empty() ? std::string("artifact") : subject;
        return NoduleError{NoduleError::Checksum,
            "integrity check failed for " + what +
            ": expected " + parsed.value().digest + ", got " + actual,
            "the downloaded archive does not match the recorded digest"};
    }

    return ok_status();
}

} // namespace nodule
