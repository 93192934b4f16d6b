#pragma once

#include <string>

namespace nodule {

struct NoduleError {
    enum Code {
        IO,
        Parse,
        Config,
        Manifest,
        Lockfile,
        Version,
        InvalidRange,
        InvalidName,
        Network,
        Registry,
        NotFound,
        UnsupportedAlgorithm,
        Checksum,
        Extract,
        Persistence,
        Cycle,
        Dependency
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    NoduleError() = default;
    NoduleError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    NoduleError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    NoduleError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Prefix the message with "<ctx>: ", keeping code and hint
    NoduleError with_context(const std::string& ctx) const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace nodule
