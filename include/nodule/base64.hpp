#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

namespace nodule::base64 {

// RFC 4648 standard alphabet with '=' padding
std::string encode(const uint8_t* data, size_t len);

} // namespace nodule::base64
