#include <guid/guid.hpp>
#include <guid/base36.hpp>
#include <guid/varint.hpp>
#include <algorithm>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace guid {

using namespace layout;

// ---- Slug positions ----
//
// | PREFIX | TIMESTAMP       | FP      | INCR    | DECR    | RANDOM  |
// | - -    | - - - - x x x x | - - - - | - - x x | - - x x | x x x x |
//
// Derived from the layout so a layout change cannot leave them stale.

static constexpr size_t kSlugTimestamp = kTimestamp.end() - 4;
static constexpr size_t kSlugIncrement = kIncrement.end() - 2;
static constexpr size_t kSlugDecrement = kDecrement.end() - 2;
static constexpr size_t kSlugRandom = kRandom.offset;

static_assert(kSlugTimestamp == 6 && kSlugIncrement == 16
              && kSlugDecrement == 20 && kSlugRandom == 22,
              "slug positions moved");
static_assert(4 + 2 + 2 + kRandom.size == kSlugSize, "slug must be 12 characters");

// ---- Field codec ----

int64_t Guid::decode(const Field& f) const {
    return varint::get(bytes_.data() + f.offset, f.size).value_or(0);
}

Guid Guid::encode(const Field& f, int64_t v) const {
    Guid out = *this;
    if (varint::put(out.bytes_.data() + f.offset, f.size, v) == 0) {
        throw std::out_of_range(
            "value " + std::to_string(v) + " does not fit in a "
            + std::to_string(f.size) + "-byte guid field");
    }
    return out;
}

// ---- Accessors ----

std::pair<uint8_t, uint8_t> Guid::prefix_bytes() const {
    return {bytes_[0], bytes_[1]};
}

Guid Guid::with_prefix_bytes(uint8_t b1, uint8_t b2) const {
    Guid out = *this;
    out.bytes_[0] = b1;
    out.bytes_[1] = b2;
    return out;
}

Guid::Clock::time_point Guid::time() const {
    return Clock::time_point(
        std::chrono::duration_cast<Clock::duration>(
            std::chrono::milliseconds(unix_millis())));
}

Guid Guid::with_time(Clock::time_point t) const {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch());
    return with_unix_millis(ms.count());
}

int64_t Guid::unix_millis() const {
    return decode(kTimestamp);
}

Guid Guid::with_unix_millis(int64_t ms) const {
    return encode(kTimestamp, ms);
}

int32_t Guid::fingerprint() const {
    return static_cast<int32_t>(decode(kFingerprint));
}

Guid Guid::with_fingerprint(int32_t v) const {
    return encode(kFingerprint, filter_field(v));
}

std::pair<int32_t, int32_t> Guid::counters() const {
    return {increment_counter(), decrement_counter()};
}

int32_t Guid::increment_counter() const {
    return static_cast<int32_t>(decode(kIncrement));
}

int32_t Guid::decrement_counter() const {
    return static_cast<int32_t>(decode(kDecrement));
}

Guid Guid::with_counters(int32_t incr, int32_t decr) const {
    return encode(kIncrement, filter_field(incr))
          .encode(kDecrement, filter_field(decr));
}

int32_t Guid::random() const {
    return static_cast<int32_t>(decode(kRandom));
}

Guid Guid::with_random(int32_t v) const {
    return encode(kRandom, filter_field(v));
}

bool Guid::is_zero() const {
    for (uint8_t b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

// ---- Text form ----

std::string Guid::to_string() const {
    std::string out;
    out.reserve(kSize);
    out += static_cast<char>(bytes_[0]);
    out += static_cast<char>(bytes_[1]);
    out += base36::format_padded(unix_millis(), kTimestamp.size);
    out += base36::format_padded(fingerprint(), kFingerprint.size);
    out += base36::format_padded(increment_counter(), kIncrement.size);
    out += base36::format_padded(decrement_counter(), kDecrement.size);
    out += base36::format_padded(random(), kRandom.size);
    return out;
}

std::string Guid::slug() const {
    std::string text = to_string();
    std::string out;
    out.reserve(kSlugSize);
    out.append(text, kSlugTimestamp, 4);
    out.append(text, kSlugIncrement, 2);
    out.append(text, kSlugDecrement, 2);
    out.append(text, kSlugRandom, kRandom.size);
    return out;
}

static Result<int64_t> parse_field(const std::string& text, const Field& f,
                                   GuidError::Code code, const char* what) {
    std::string part = text.substr(f.offset, f.size);
    auto r = base36::parse(part);
    if (r.is_err()) {
        return GuidError(code,
            std::string("invalid ") + what + " value '" + part + "'",
            r.error().message);
    }
    return r;
}

Result<Guid> Guid::parse(const std::string& text) {
    if (text.size() != kSize) {
        return GuidError(GuidError::InvalidLength,
            "guid must be exactly " + std::to_string(kSize) + " bytes in length",
            "got " + std::to_string(text.size()) + " bytes");
    }

    Guid g = Guid().with_prefix_bytes(static_cast<uint8_t>(text[0]),
                                      static_cast<uint8_t>(text[1]));

    auto ts = parse_field(text, kTimestamp, GuidError::InvalidTimestamp, "time");
    GUID_TRY(ts);
    g = g.with_unix_millis(ts.value());

    auto fp = parse_field(text, kFingerprint, GuidError::InvalidFingerprint, "fingerprint");
    GUID_TRY(fp);
    g = g.with_fingerprint(filter_field(fp.value()));

    auto incr = parse_field(text, kIncrement,
                            GuidError::InvalidIncrementCounter, "increment counter");
    GUID_TRY(incr);
    auto decr = parse_field(text, kDecrement,
                            GuidError::InvalidDecrementCounter, "decrement counter");
    GUID_TRY(decr);
    g = g.with_counters(filter_field(incr.value()), filter_field(decr.value()));

    auto rd = parse_field(text, kRandom, GuidError::InvalidRandom, "random");
    GUID_TRY(rd);
    g = g.with_random(filter_field(rd.value()));

    return Result<Guid>::ok(g);
}

// ---- Binary form ----

Result<Guid> Guid::from_bytes(const uint8_t* data, size_t len) {
    if (len != kSize) {
        return GuidError(GuidError::InvalidLength,
            "guid must be exactly " + std::to_string(kSize) + " bytes in length",
            "got " + std::to_string(len) + " bytes");
    }

    Guid g;
    std::copy(data, data + kSize, g.bytes_.begin());

    if (!varint::get(data + kTimestamp.offset, kTimestamp.size)) {
        return GuidError(GuidError::InvalidTimestamp,
            "timestamp bytes hold no terminated varint");
    }

    struct Check { Field field; GuidError::Code code; const char* what; };
    static const Check checks[] = {
        {kFingerprint, GuidError::InvalidFingerprint, "fingerprint"},
        {kIncrement, GuidError::InvalidIncrementCounter, "increment counter"},
        {kDecrement, GuidError::InvalidDecrementCounter, "decrement counter"},
        {kRandom, GuidError::InvalidRandom, "random"},
    };
    for (const auto& c : checks) {
        auto v = varint::get(data + c.field.offset, c.field.size);
        if (!v || *v < 0 || *v >= kFieldModulus) {
            return GuidError(c.code,
                std::string(c.what) + " bytes do not hold a value in [0, "
                + std::to_string(kFieldModulus) + ")");
        }
    }
    return Result<Guid>::ok(g);
}

// ---- Streams ----

std::ostream& operator<<(std::ostream& os, const Guid& g) {
    return os << g.to_string();
}

std::istream& operator>>(std::istream& is, Guid& g) {
    std::string token;
    if (!(is >> token)) return is;
    auto r = Guid::parse(token);
    if (r.is_err()) {
        is.setstate(std::ios::failbit);
        return is;
    }
    g = r.value();
    return is;
}

} // namespace guid
