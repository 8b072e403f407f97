#pragma once

#include "storage/sorted_set.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>

namespace memkv {

// ── Value ─────────────────────────────────────────────────────────────────────
//
// Everything a key can hold.  The alternative index doubles as the
// command-level type tag used for WRONGTYPE checks, so the order of the
// alternatives must match ValueType.

using StringValue = std::string;
using ListValue   = std::deque<std::string>;
using SetValue    = std::unordered_set<std::string>;

using Value = std::variant<StringValue, ListValue, SetValue, SortedSet>;

enum class ValueType : uint8_t {
    String    = 0,
    List      = 1,
    Set       = 2,
    SortedSet = 3,
};

[[nodiscard]] inline ValueType type_of(const Value& v) noexcept {
    return static_cast<ValueType>(v.index());
}

// Name reported by TYPE: "string", "list", "set", "zset".
[[nodiscard]] std::string_view type_name(ValueType type) noexcept;

// Parse a TYPE name back (used by the snapshot loader and tests).
[[nodiscard]] std::optional<ValueType> type_from_name(std::string_view name) noexcept;

// Maps a C++ alternative to its ValueType at compile time.
template <typename T> struct value_type_of;
template <> struct value_type_of<StringValue> { static constexpr ValueType value = ValueType::String; };
template <> struct value_type_of<ListValue>   { static constexpr ValueType value = ValueType::List; };
template <> struct value_type_of<SetValue>    { static constexpr ValueType value = ValueType::Set; };
template <> struct value_type_of<SortedSet>   { static constexpr ValueType value = ValueType::SortedSet; };

// True for containers that must never be stored empty.
[[nodiscard]] bool is_empty_container(const Value& v) noexcept;

} // namespace memkv
