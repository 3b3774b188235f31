#include <guid/generator.hpp>
#include <guid/log.hpp>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#include <process.h>
#include <winsock2.h>
#define getpid _getpid
#else
#include <unistd.h>
#endif

namespace guid {

Option with_prefix_bytes(uint8_t b1, uint8_t b2) {
    return [b1, b2](Guid g) { return g.with_prefix_bytes(b1, b2); };
}

// ---- Random and fingerprint sources ----

Status system_random(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return ok_status();
    }

    log::debug("/dev/urandom unavailable, using std::random_device");
    try {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::uniform_int_distribution<unsigned> dist(0, 255);
        for (size_t i = 0; i < len; ++i) {
            buf[i] = static_cast<uint8_t>(dist(gen));
        }
    } catch (const std::exception& e) {
        return GuidError(GuidError::Random, "no random source available", e.what());
    }
    return ok_status();
}

int32_t default_fingerprint() {
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0) {
        host[0] = '\0';
    }
    std::string name(host);

    // Two base36 digits from the pid, two from the host name
    int64_t host_sum = static_cast<int64_t>(name.size()) + 36;
    for (char c : name) host_sum += static_cast<unsigned char>(c);

    int64_t pid = static_cast<int64_t>(getpid());
    return filter_field((pid % 1296) * 1296 + host_sum % 1296);
}

// ---- Generator ----

Generator::Generator() : Generator(GeneratorOptions{}) {}

Generator::Generator(GeneratorOptions opts)
    : incr_(opts.increment_start),
      decr_(opts.decrement_start),
      fingerprint_(filter_field(opts.fingerprint)),
      prefix_(static_cast<uint16_t>((opts.prefix[0] << 8) | opts.prefix[1])),
      random_(std::move(opts.random)),
      now_(std::move(opts.now)) {}

void Generator::set_prefix_bytes(uint8_t b1, uint8_t b2) {
    prefix_ = static_cast<uint16_t>((b1 << 8) | b2);
}

std::pair<uint8_t, uint8_t> Generator::prefix_bytes() const {
    uint16_t p = prefix_;
    return {static_cast<uint8_t>(p >> 8), static_cast<uint8_t>(p & 0xFF)};
}

void Generator::set_fingerprint(int32_t fp) {
    fingerprint_ = filter_field(fp);
}

int32_t Generator::fingerprint() const {
    return fingerprint_;
}

Result<Guid> Generator::generate() {
    if (!random_ || !now_) {
        return GuidError(GuidError::InvalidArg,
            "generator has no random source or clock");
    }

    uint8_t buf[4];
    {
        std::lock_guard<std::mutex> lock(random_mu_);
        auto st = random_(buf, sizeof(buf));
        if (st.is_err()) {
            return GuidError(GuidError::Random,
                "reading the random source failed", st.error().format());
        }
    }
    uint32_t word = (uint32_t(buf[0]) << 24) | (uint32_t(buf[1]) << 16)
                  | (uint32_t(buf[2]) << 8)  |  uint32_t(buf[3]);

    int64_t incr = incr_.fetch_add(1);
    int64_t decr = decr_.fetch_sub(1);
    auto [b1, b2] = prefix_bytes();

    Guid g = Guid()
        .with_prefix_bytes(b1, b2)
        .with_time(now_())
        .with_fingerprint(fingerprint_)
        .with_counters(filter_field(incr), filter_field(decr))
        .with_random(filter_field(word));
    return Result<Guid>::ok(g);
}

// ---- Default generator ----

Generator& default_generator() {
    static Generator gen;
    return gen;
}

void set_global_prefix_bytes(uint8_t b1, uint8_t b2) {
    default_generator().set_prefix_bytes(b1, b2);
}

void set_global_fingerprint(int32_t fp) {
    default_generator().set_fingerprint(fp);
}

Result<Guid> new_guid(std::initializer_list<Option> opts) {
    auto r = default_generator().generate();
    GUID_TRY(r);
    Guid g = r.value();
    for (const auto& opt : opts) {
        g = opt(g);
    }
    return Result<Guid>::ok(g);
}

} // namespace guid
