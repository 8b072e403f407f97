#include "storage/glob.hpp"

#include <cstddef>
#include <utility>

namespace memkv {

namespace {

bool in_range(char c, char lo, char hi) {
    auto uc = static_cast<unsigned char>(c);
    auto ulo = static_cast<unsigned char>(lo);
    auto uhi = static_cast<unsigned char>(hi);
    if (ulo > uhi) {
        std::swap(ulo, uhi);
    }
    return uc >= ulo && uc <= uhi;
}

// Matches the "[...]" set starting at pattern[p] against `c` and moves `p`
// past the closing bracket.
bool match_set(std::string_view pattern, std::size_t& p, char c) {
    std::size_t i = p + 1;
    const bool negate = i < pattern.size() && pattern[i] == '^';
    if (negate) {
        ++i;
    }

    bool matched = false;
    while (i < pattern.size() && pattern[i] != ']') {
        if (pattern[i] == '\\' && i + 1 < pattern.size()) {
            matched = matched || pattern[i + 1] == c;
            i += 2;
        } else if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            matched = matched || in_range(c, pattern[i], pattern[i + 2]);
            i += 3;
        } else {
            matched = matched || pattern[i] == c;
            ++i;
        }
    }
    if (i < pattern.size()) {
        ++i;   // ']'
    }
    p = i;
    return negate ? !matched : matched;
}

// Matches the single-byte token at pattern[p] against `c`; on success `p`
// moves past the token.
bool match_token(std::string_view pattern, std::size_t& p, char c) {
    switch (pattern[p]) {
        case '?':
            ++p;
            return true;
        case '[':
            return match_set(pattern, p, c);
        case '\\':
            if (p + 1 < pattern.size()) {
                const bool ok = pattern[p + 1] == c;
                p += 2;
                return ok;
            }
            break;
        default:
            break;
    }
    const bool ok = pattern[p] == c;
    ++p;
    return ok;
}

} // anonymous namespace

bool glob_match(std::string_view pattern, std::string_view text) {
    constexpr auto npos = std::string_view::npos;

    std::size_t p = 0;
    std::size_t t = 0;
    // Position after the last '*' seen and the text position it was tried at.
    std::size_t star_p = npos;
    std::size_t star_t = 0;

    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            while (p < pattern.size() && pattern[p] == '*') {
                ++p;
            }
            if (p == pattern.size()) {
                return true;
            }
            star_p = p;
            star_t = t;
            continue;
        }

        std::size_t next = p;
        if (p < pattern.size() && match_token(pattern, next, text[t])) {
            p = next;
            ++t;
            continue;
        }

        // Let the last '*' swallow one more byte and retry.
        if (star_p == npos) {
            return false;
        }
        p = star_p;
        t = ++star_t;
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

} // namespace memkv
