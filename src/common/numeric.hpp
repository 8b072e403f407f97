#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace memkv {

// Strict decimal integer: optional '-', digits, nothing else, no overflow.
[[nodiscard]] bool parse_int64(std::string_view sv, int64_t& out) noexcept;

// Strict floating-point: the whole string must be consumed.  Accepts
// "inf" / "+inf" / "-inf"; rejects NaN, empty input and leading whitespace.
[[nodiscard]] bool parse_double(std::string_view sv, double& out);

// Shortest representation that parses back to the same double
// ("1", "1.5", "inf", "-inf").
[[nodiscard]] std::string format_double(double value);

} // namespace memkv
