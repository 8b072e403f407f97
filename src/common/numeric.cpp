#include "common/numeric.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>

#include <spdlog/fmt/fmt.h>

namespace memkv {

bool parse_int64(std::string_view sv, int64_t& out) noexcept {
    if (sv.empty() || sv.front() == '+') {
        return false;
    }
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

bool parse_double(std::string_view sv, double& out) {
    if (sv.empty() || std::isspace(static_cast<unsigned char>(sv.front()))) {
        return false;
    }
    // strtod needs a NUL-terminated buffer.
    const std::string buf{sv};
    char* end = nullptr;
    const double value = std::strtod(buf.c_str(), &end);
    if (end != buf.c_str() + buf.size() || std::isnan(value)) {
        return false;
    }
    out = value;
    return true;
}

std::string format_double(double value) {
    return fmt::format("{}", value);
}

} // namespace memkv
