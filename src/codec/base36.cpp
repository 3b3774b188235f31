#include <guid/base36.hpp>
#include <limits>

namespace guid::base36 {

static const char base36_chars[] = "0123456789abcdefghijklmnopqrstuvwxyz";

static int base36_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'z') return c - 'a' + 10;
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    return -1;
}

static std::string digits_of(uint64_t magnitude) {
    char buf[16];
    size_t pos = sizeof(buf);
    do {
        buf[--pos] = base36_chars[magnitude % 36];
        magnitude /= 36;
    } while (magnitude > 0);
    return std::string(buf + pos, sizeof(buf) - pos);
}

static uint64_t magnitude_of(int64_t v) {
    // Negating in unsigned space keeps INT64_MIN well-defined
    return v < 0 ? 0 - static_cast<uint64_t>(v) : static_cast<uint64_t>(v);
}

std::string format(int64_t v) {
    std::string digits = digits_of(magnitude_of(v));
    return v < 0 ? "-" + digits : digits;
}

std::string format_padded(int64_t v, size_t width) {
    std::string digits = digits_of(magnitude_of(v));
    size_t sign = v < 0 ? 1 : 0;
    if (digits.size() + sign < width) {
        digits.insert(0, width - sign - digits.size(), '0');
    }
    return v < 0 ? "-" + digits : digits;
}

static GuidError syntax_error(const std::string& s) {
    return GuidError(GuidError::Parse,
        "parsing \"" + s + "\": invalid syntax");
}

Result<int64_t> parse(const std::string& s) {
    size_t i = 0;
    bool negative = false;
    if (!s.empty() && (s[0] == '+' || s[0] == '-')) {
        negative = s[0] == '-';
        i = 1;
    }
    if (i == s.size()) {
        return syntax_error(s);
    }

    const uint64_t limit = negative
        ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1
        : static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

    uint64_t acc = 0;
    for (; i < s.size(); ++i) {
        int d = base36_val(s[i]);
        if (d < 0) {
            return syntax_error(s);
        }
        if (acc > (limit - static_cast<uint64_t>(d)) / 36) {
            return GuidError(GuidError::Parse,
                "parsing \"" + s + "\": value out of range");
        }
        acc = acc * 36 + static_cast<uint64_t>(d);
    }

    int64_t v = negative
        ? static_cast<int64_t>(0 - acc)
        : static_cast<int64_t>(acc);
    return Result<int64_t>::ok(v);
}

} // namespace guid::base36
