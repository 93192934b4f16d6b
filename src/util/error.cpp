#include <nodule/error.hpp>

namespace nodule {

const char* NoduleError::code_name(Code c) {
    switch (c) {
        case IO:                   return "IO";
        case Parse:                return "Parse";
        case Config:               return "Config";
        case Manifest:             return "Manifest";
        case Lockfile:             return "Lockfile";
        case Version:              return "Version";
        case InvalidRange:         return "InvalidRange";
        case InvalidName:          return "InvalidName";
        case Network:              return "Network";
        case Registry:             return "Registry";
        case NotFound:             return "NotFound";
        case UnsupportedAlgorithm: return "UnsupportedAlgorithm";
        case Checksum:             return "Checksum";
        case Extract:              return "Extract";
        case Persistence:          return "Persistence";
        case Cycle:                return "Cycle";
        case Dependency:           return "Dependency";
    }
    return "Unknown";
}

NoduleError NoduleError::with_context(const std::string& ctx) const {
    NoduleError e = *this;
    if (!ctx.empty()) {
        e.message = ctx + ": " + message;
    }
    return e;
}

std::string NoduleError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace nodule
