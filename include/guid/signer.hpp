#pragma once

#include <guid/guid.hpp>
#include <optional>
#include <string>

// Watermarking, not authentication: anyone holding a guid can produce a
// digest that passes did_sign, and an all-ones digest passes for every guid.
namespace guid {

// SHA-256 of `data` with guid bytes 0-13 and 14-25 OR-folded in, as 64
// lowercase hex characters. std::nullopt when `data` is empty.
std::optional<std::string> sign(const Guid& g, const std::string& data);

// True when every bit sign() would have set from `g` is set in `hex_digest`.
// Malformed hex or a decoded length other than 32 bytes is simply false.
bool did_sign(const Guid& g, const std::string& hex_digest);

} // namespace guid
