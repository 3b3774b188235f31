#pragma once

#include <guid/result.hpp>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <utility>

namespace guid {

// A fixed byte range inside the 26-byte layout. The text form uses the same
// offsets: one character per byte.
struct Field {
    size_t offset;
    size_t size;

    constexpr size_t end() const { return offset + size; }
};

namespace layout {

constexpr size_t kSize = 26;
constexpr size_t kFieldSize = 4;

constexpr Field kPrefix{0, 2};
constexpr Field kTimestamp{kPrefix.end(), 2 * kFieldSize};
constexpr Field kFingerprint{kTimestamp.end(), kFieldSize};
constexpr Field kIncrement{kFingerprint.end(), kFieldSize};
constexpr Field kDecrement{kIncrement.end(), kFieldSize};
constexpr Field kRandom{kDecrement.end(), kFieldSize};

static_assert(kRandom.end() == kSize, "fields must cover the whole guid");

// 36^4: every 4-byte field renders as exactly four base36 digits
constexpr int32_t kFieldModulus = 1679616;

constexpr size_t kSlugSize = 12;

} // namespace layout

// Reduces v into [0, kFieldModulus).
constexpr int32_t filter_field(int64_t v) {
    int64_t r = v % layout::kFieldModulus;
    return static_cast<int32_t>(r < 0 ? r + layout::kFieldModulus : r);
}

//  prefix  timestamp          fingerprint  incr       decr       random
// [b b]   [b b b b b b b b]  [b b b b]    [b b b b]  [b b b b]  [b b b b]
//
// Guid is an immutable value: every with_* call returns a modified copy.
class Guid {
public:
    using Bytes = std::array<uint8_t, layout::kSize>;
    using Clock = std::chrono::system_clock;

    // The zero guid: NUL prefix, every numeric field 0
    Guid() : bytes_{} {}

    std::pair<uint8_t, uint8_t> prefix_bytes() const;
    Guid with_prefix_bytes(uint8_t b1, uint8_t b2) const;

    // Sub-millisecond precision is dropped.
    Clock::time_point time() const;
    Guid with_time(Clock::time_point t) const;

    int64_t unix_millis() const;
    // Throws std::out_of_range when ms needs more than the 8-byte field
    // (|ms| >= 2^55).
    Guid with_unix_millis(int64_t ms) const;

    int32_t fingerprint() const;
    Guid with_fingerprint(int32_t v) const;

    // (increment, decrement)
    std::pair<int32_t, int32_t> counters() const;
    int32_t increment_counter() const;
    int32_t decrement_counter() const;
    Guid with_counters(int32_t incr, int32_t decr) const;

    int32_t random() const;
    Guid with_random(int32_t v) const;

    // 26 characters: prefix, then base36 fields padded to 8/4/4/4/4
    std::string to_string() const;

    // Lossy 12-character form for display and URLs. Cannot be parsed back.
    std::string slug() const;

    static Result<Guid> parse(const std::string& text);

    // Raw 26-byte form. from_bytes checks that each field holds a value
    // its setter could have written.
    const Bytes& bytes() const { return bytes_; }
    static Result<Guid> from_bytes(const uint8_t* data, size_t len);

    uint8_t operator[](size_t i) const { return bytes_[i]; }
    bool is_zero() const;

    // Byte order, not chronological order
    bool operator<(const Guid& other) const { return bytes_ < other.bytes_; }
    bool operator==(const Guid& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Guid& other) const { return bytes_ != other.bytes_; }

private:
    int64_t decode(const Field& f) const;
    Guid encode(const Field& f, int64_t v) const;

    Bytes bytes_;
};

std::ostream& operator<<(std::ostream& os, const Guid& g);

// Reads one whitespace-delimited token; sets failbit when it does not parse.
std::istream& operator>>(std::istream& is, Guid& g);

} // namespace guid

namespace std {

template<>
struct hash<guid::Guid> {
    size_t operator()(const guid::Guid& g) const noexcept {
        // FNV-1a
        uint64_t h = 14695981039346656037ull;
        for (uint8_t b : g.bytes()) {
            h ^= b;
            h *= 1099511628211ull;
        }
        return static_cast<size_t>(h);
    }
};

} // namespace std
