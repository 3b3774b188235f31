#pragma once

#include <guid/result.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace guid::base36 {

// Lowercase base36 with a leading '-' for negative values
std::string format(int64_t v);

// format() left-padded with '0' to `width` characters. The sign stays in
// front of the padding ("-001"). Values wider than `width` are not cut.
std::string format_padded(int64_t v, size_t width);

// Parses an optionally signed base36 integer, case-insensitive. Empty
// input, stray characters and values outside int64 are Parse errors.
Result<int64_t> parse(const std::string& s);

} // namespace guid::base36
