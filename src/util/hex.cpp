#include <guid/hex.hpp>

namespace guid::hex {

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += hex_chars[data[i] >> 4];
        out += hex_chars[data[i] & 0x0F];
    }
    return out;
}

Result<std::vector<uint8_t>> decode(const std::string& s) {
    if (s.size() % 2 != 0) {
        return GuidError(GuidError::Parse,
            "hex string has odd length " + std::to_string(s.size()));
    }

    std::vector<uint8_t> out;
    out.reserve(s.size() / 2);
    for (size_t i = 0; i < s.size(); i += 2) {
        int hi = hex_val(s[i]);
        int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0) {
            size_t bad = hi < 0 ? i : i + 1;
            return GuidError(GuidError::Parse,
                "hex string contains invalid character",
                std::string("invalid byte at position ") + std::to_string(bad));
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return Result<std::vector<uint8_t>>::ok(std::move(out));
}

} // namespace guid::hex
