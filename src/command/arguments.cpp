#include "command/arguments.hpp"

#include "common/errors.hpp"
#include "common/numeric.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace memkv::command {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

int64_t parse_integer(const std::string& text) {
    int64_t value = 0;
    if (!parse_int64(text, value)) {
        throw not_an_integer_error();
    }
    return value;
}

double parse_float(const std::string& text) {
    double value = 0;
    if (!parse_double(text, value)) {
        throw not_a_float_error();
    }
    return value;
}

ScoreRange parse_score_range(const std::string& min, const std::string& max) {
    ScoreRange range;
    if (!parse_score_bound(min, range.min, range.min_exclusive) ||
        !parse_score_bound(max, range.max, range.max_exclusive)) {
        throw invalid_argument_error("min or max is not a float");
    }
    return range;
}

int64_t parse_timeout_ms(const std::string& text) {
    double seconds = 0;
    if (!parse_double(text, seconds) || std::isinf(seconds)) {
        throw invalid_argument_error("timeout is not a float or out of range");
    }
    if (seconds < 0) {
        throw invalid_argument_error("timeout is negative");
    }
    const double ms = std::ceil(seconds * 1000.0);
    if (ms > static_cast<double>(std::numeric_limits<int64_t>::max() / 2)) {
        throw invalid_argument_error("timeout is not a float or out of range");
    }
    return static_cast<int64_t>(ms);
}

std::optional<IndexRange> normalize_range(int64_t start, int64_t stop,
                                          std::size_t len) noexcept {
    const auto n = static_cast<int64_t>(len);
    if (start < 0) start += n;
    if (stop < 0) stop += n;
    if (start < 0) start = 0;
    if (start > stop || start >= n) {
        return std::nullopt;
    }
    if (stop >= n) stop = n - 1;
    return IndexRange{static_cast<std::size_t>(start), static_cast<std::size_t>(stop)};
}

std::optional<std::size_t> normalize_index(int64_t index, std::size_t len) noexcept {
    const auto n = static_cast<int64_t>(len);
    if (index < 0) index += n;
    if (index < 0 || index >= n) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(index);
}

int64_t checked_add(int64_t a, int64_t b) {
    int64_t result = 0;
    if (__builtin_add_overflow(a, b, &result)) {
        throw invalid_argument_error("increment or decrement would overflow");
    }
    return result;
}

} // namespace memkv::command
