#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>

namespace guid {

// FIPS 180-4 SHA-256. Used by the signer to digest payloads.
class Sha256 {
public:
    static constexpr size_t kDigestSize = 32;
    using Digest = std::array<uint8_t, kDigestSize>;

    Sha256();

    // Feed data in chunks
    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Finalize and return the digest. Object should not be reused after
    // this call.
    Digest finalize();

    // One-shot helpers
    static Digest digest(const uint8_t* data, size_t len);
    static Digest digest(const std::string& input);
    static std::string hash_hex(const std::string& input);

private:
    void process_block(const uint8_t block[64]);

    std::array<uint32_t, 8> state_;   // H0..H7
    uint64_t total_bytes_;             // message length so far
    uint8_t  buffer_[64];              // partial block accumulator
    size_t   buffer_len_;              // bytes in buffer_
};

} // namespace guid
