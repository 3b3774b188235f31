#include <guid/signer.hpp>
#include <guid/hex.hpp>
#include <guid/sha256.hpp>
#include <array>

namespace guid {

namespace {

struct Fold {
    uint8_t digest;   // index into the SHA-256 digest
    uint8_t guid;     // index into the guid bytes
};

constexpr size_t kLast = Sha256::kDigestSize - 1;

// Timestamp and fingerprint bytes (2..13) fold forward into digest 0..11;
// counters and random (25..14) fold backward into digest 31..20; the prefix
// lands on digest 12 and 13.
constexpr std::array<Fold, 26> make_fold_table() {
    std::array<Fold, 26> t{};
    size_t n = 0;
    for (size_t i = 2; i < 14; ++i) {
        size_t tail = kLast - (i - 2);
        t[n++] = {static_cast<uint8_t>(i - 2), static_cast<uint8_t>(i)};
        t[n++] = {static_cast<uint8_t>(tail), static_cast<uint8_t>(tail - 6)};
    }
    t[n++] = {12, 0};
    t[n++] = {13, 1};
    return t;
}

constexpr std::array<Fold, 26> kFoldTable = make_fold_table();

static_assert(kFoldTable[1].digest == 31 && kFoldTable[1].guid == 25, "tail fold start");
static_assert(kFoldTable[23].digest == 20 && kFoldTable[23].guid == 14, "tail fold end");

} // namespace

std::optional<std::string> sign(const Guid& g, const std::string& data) {
    if (data.empty()) return std::nullopt;

    Sha256::Digest sum = Sha256::digest(data);
    for (const Fold& f : kFoldTable) {
        sum[f.digest] |= g[f.guid];
    }
    return hex::encode(sum.data(), sum.size());
}

bool did_sign(const Guid& g, const std::string& hex_digest) {
    auto decoded = hex::decode(hex_digest);
    if (decoded.is_err()) return false;

    const auto& sum = decoded.value();
    if (sum.size() != Sha256::kDigestSize) return false;

    for (const Fold& f : kFoldTable) {
        uint8_t want = g[f.guid];
        if ((sum[f.digest] & want) != want) return false;
    }
    return true;
}

} // namespace guid
