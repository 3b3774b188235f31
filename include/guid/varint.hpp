#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

// Zig-zag + base-128 variable-length integers, written into fixed-width
// byte fields. Groups of 7 bits are emitted least significant first; every
// byte but the last carries the 0x80 continuation bit.
namespace guid::varint {

// Longest encoding of a 64-bit value
constexpr size_t kMaxLen64 = 10;

constexpr uint64_t zigzag_encode(int64_t n) {
    return (static_cast<uint64_t>(n) << 1) ^ static_cast<uint64_t>(n >> 63);
}

constexpr int64_t zigzag_decode(uint64_t u) {
    return static_cast<int64_t>(u >> 1) ^ -static_cast<int64_t>(u & 1);
}

// Bytes needed to encode n
size_t encoded_size(int64_t n);

// Encodes n into field[0..len) and zeroes the bytes after the terminator.
// Returns the number of bytes used, or 0 (field untouched) when n does not
// fit in len bytes.
size_t put(uint8_t* field, size_t len, int64_t n);

// Decodes the value at the start of field[0..len). Bytes after the
// terminating byte are ignored. Returns std::nullopt when no terminator is
// found within len bytes or the value overflows 64 bits.
std::optional<int64_t> get(const uint8_t* field, size_t len);

} // namespace guid::varint
