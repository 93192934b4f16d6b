#include <nodule/base64.hpp>

namespace nodule::base64 {

static const char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out += ALPHABET[(n >> 18) & 0x3f];
        out += ALPHABET[(n >> 12) & 0x3f];
        out += ALPHABET[(n >> 6) & 0x3f];
        out += ALPHABET[n & 0x3f];
    }

    size_t rest = len - i;
    if (rest == 1) {
        uint32_t n = uint32_t(data[i]) << 16;
        out += ALPHABET[(n >> 18) & 0x3f];
        out += ALPHABET[(n >> 12) & 0x3f];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out += ALPHABET[(n >> 18) & 0x3f];
        out += ALPHABET[(n >> 12) & 0x3f];
        out += ALPHABET[(n >> 6) & 0x3f];
        out += '=';
    }
    return out;
}

} // namespace nodule::base64
