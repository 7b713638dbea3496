#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace cw {

// "1048576", "64KiB", "1.5m", "2 GB". Units k/m/g with optional B or iB,
// any case, all powers of 1024. Fractions are truncated to whole bytes.
// nullopt on garbage, negatives or overflow.
std::optional<std::uint64_t> parse_byte_size(std::string_view s);

// Plain non-negative decimal integer.
std::optional<std::uint64_t> parse_count(std::string_view s);

}
