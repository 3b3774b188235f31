#pragma once

#include <guid/guid.hpp>
#include <guid/result.hpp>
#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <mutex>

namespace guid {

// Fills buf[0..len) with random bytes
using RandomSource = std::function<Status(uint8_t* buf, size_t len)>;
using NowFunc = std::function<Guid::Clock::time_point()>;

// Applied to a freshly generated guid, e.g. with_prefix_bytes()
using Option = std::function<Guid(Guid)>;

Option with_prefix_bytes(uint8_t b1, uint8_t b2);

// /dev/urandom, falling back to std::random_device + mt19937_64
Status system_random(uint8_t* buf, size_t len);

// Stable per host and process: host name and pid, reduced into the field
// range
int32_t default_fingerprint();

struct GeneratorOptions {
    int32_t fingerprint = default_fingerprint();
    std::array<uint8_t, 2> prefix{{0, 0}};
    RandomSource random = system_random;
    NowFunc now = [] { return Guid::Clock::now(); };
    int32_t increment_start = 0;
    int32_t decrement_start = layout::kFieldModulus - 1;
};

// Stamps guids with the clock, fingerprint, both counters and a random
// value. Safe to share between threads.
class Generator {
public:
    Generator();
    explicit Generator(GeneratorOptions opts);

    Result<Guid> generate();

    void set_prefix_bytes(uint8_t b1, uint8_t b2);
    std::pair<uint8_t, uint8_t> prefix_bytes() const;

    void set_fingerprint(int32_t fp);
    int32_t fingerprint() const;

private:
    std::atomic<int64_t> incr_;
    std::atomic<int64_t> decr_;
    std::atomic<int32_t> fingerprint_;
    std::atomic<uint16_t> prefix_;   // b1 in the high byte

    std::mutex random_mu_;
    RandomSource random_;
    NowFunc now_;
};

// ---- Process-wide default generator ----

Generator& default_generator();
void set_global_prefix_bytes(uint8_t b1, uint8_t b2);
void set_global_fingerprint(int32_t fp);

// Generates from default_generator() and applies opts in order
Result<Guid> new_guid(std::initializer_list<Option> opts = {});

} // namespace guid
