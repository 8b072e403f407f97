#pragma once

#include <string_view>

namespace memkv {

// ── glob_match ────────────────────────────────────────────────────────────────
//
// Binary-safe glob matching used by KEYS.  Both arguments may contain NUL
// bytes.  Supported syntax:
//
//   *        any run of bytes, including none
//   ?        exactly one byte
//   [abc]    one byte from the set; ranges "a-z", negation "[^...]"
//   \x       the byte x literally (also inside a set)
//
// An unterminated '[' extends to the end of the pattern.

[[nodiscard]] bool glob_match(std::string_view pattern, std::string_view text);

} // namespace memkv
