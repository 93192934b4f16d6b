#pragma once

#include <nodule/result.hpp>
#include <string>

namespace nodule {

// Subresource-integrity style digest: "<algorithm>-<base64 hash>".
// Only sha512 is accepted.
struct Integrity {
    std::string algorithm;
    std::string digest;   // base64 text as written

    static Result<Integrity> parse(const std::string& s);

    // "sha512-<base64(SHA512(bytes))>"
    static std::string of(const std::string& bytes);

    std::string to_string() const { return algorithm + "-" + digest; }
};

// Ok when SHA-512 of `content` matches `expected` byte for byte.
// UnsupportedAlgorithm for a malformed or non-sha512 digest, Checksum on
// mismatch. `subject` names the artifact in error messages.
Status verify_integrity(const std::string& expected,
                        const std::string& content,
                        const std::string& subject = "");

} // namespace nodule
