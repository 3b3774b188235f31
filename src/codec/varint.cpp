#include <guid/varint.hpp>
#include <cstring>

namespace guid::varint {

size_t encoded_size(int64_t n) {
    uint64_t u = zigzag_encode(n);
    size_t len = 1;
    while (u >= 0x80) {
        u >>= 7;
        ++len;
    }
    return len;
}

size_t put(uint8_t* field, size_t len, int64_t n) {
    size_t need = encoded_size(n);
    if (need > len) return 0;

    uint64_t u = zigzag_encode(n);
    size_t i = 0;
    while (u >= 0x80) {
        field[i++] = static_cast<uint8_t>(u | 0x80);
        u >>= 7;
    }
    field[i++] = static_cast<uint8_t>(u);
    std::memset(field + i, 0, len - i);
    return i;
}

std::optional<int64_t> get(const uint8_t* field, size_t len) {
    uint64_t u = 0;
    unsigned shift = 0;
    for (size_t i = 0; i < len && i < kMaxLen64; ++i) {
        uint8_t b = field[i];
        if (b < 0x80) {
            // The tenth byte may only contribute the top bit
            if (i == kMaxLen64 - 1 && b > 1) return std::nullopt;
            u |= static_cast<uint64_t>(b) << shift;
            return zigzag_decode(u);
        }
        u |= static_cast<uint64_t>(b & 0x7F) << shift;
        shift += 7;
    }
    return std::nullopt;
}

} // namespace guid::varint
