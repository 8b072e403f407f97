#pragma once

#include "storage/sorted_set.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace memkv::command {

// ── Argument helpers shared by the command families ───────────────────────────
//
// The parse_* functions throw CommandError with the stable client-facing
// messages; handlers call them before mutating anything.

[[nodiscard]] std::string to_lower(std::string_view s);
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

// "ERR value is not an integer or out of range"
[[nodiscard]] int64_t parse_integer(const std::string& text);

// "ERR value is not a valid float"
[[nodiscard]] double parse_float(const std::string& text);

// "ERR min or max is not a float"
[[nodiscard]] ScoreRange parse_score_range(const std::string& min, const std::string& max);

// Blocking timeout in seconds (fractions allowed) converted to ms.
// 0 means wait forever.
[[nodiscard]] int64_t parse_timeout_ms(const std::string& text);

// Inclusive index window after resolving negative indices against `len` and
// clamping.  nullopt when the window is empty.
struct IndexRange {
    std::size_t start;
    std::size_t stop;
};

[[nodiscard]] std::optional<IndexRange> normalize_range(int64_t start, int64_t stop,
                                                        std::size_t len) noexcept;

// Single index; negative counts from the end.  nullopt when out of range.
[[nodiscard]] std::optional<std::size_t> normalize_index(int64_t index,
                                                         std::size_t len) noexcept;

// a + b, or throws "ERR increment or decrement would overflow".
[[nodiscard]] int64_t checked_add(int64_t a, int64_t b);

} // namespace memkv::command
