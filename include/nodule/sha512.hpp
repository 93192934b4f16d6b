#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>

namespace nodule {

class SHA512 {
public:
    static constexpr size_t DIGEST_SIZE = 64;
    using Digest = std::array<uint8_t, DIGEST_SIZE>;

    SHA512();

    // Feed data in chunks
    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Finalize and return the 64-byte digest. Object should not be
    // reused after this call.
    Digest finalize();

    // One-shot helper
    static Digest hash(const std::string& input);

private:
    void process_block(const uint8_t block[128]);

    std::array<uint64_t, 8> state_;   // H0..H7
    uint64_t total_bytes_;             // total bytes fed so far
    uint8_t  buffer_[128];             // partial block accumulator
    size_t   buffer_len_;              // bytes in buffer_
};

} // namespace nodule
