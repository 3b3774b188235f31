#pragma once

#include <guid/result.hpp>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace guid::hex {

// Lowercase hex, two characters per byte
std::string encode(const uint8_t* data, size_t len);

// Accepts either case. Odd length or a non-hex character is a Parse error.
Result<std::vector<uint8_t>> decode(const std::string& s);

} // namespace guid::hex
