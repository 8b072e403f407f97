#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace memkv {

// ── Replies ───────────────────────────────────────────────────────────────────
//
// Logical reply produced by a command.  Each kind is a plain struct; Reply
// wraps them in a std::variant so the codec can std::visit over it.  Arrays
// nest, hence the wrapper struct instead of a bare alias.

struct Reply;

struct StatusReply {
    std::string text;              // "OK", "PONG", "string", …
};

struct ErrorReply {
    std::string message;           // category word first: "ERR …", "WRONGTYPE …"
};

struct IntegerReply {
    int64_t value = 0;
};

struct BulkReply {
    std::optional<std::string> value;   // nullopt = nil bulk
};

struct ArrayReply {
    std::optional<std::vector<Reply>> elements;   // nullopt = nil multi-bulk
};

struct Reply {
    using Variant = std::variant<StatusReply, ErrorReply, IntegerReply, BulkReply, ArrayReply>;

    Reply() : value(StatusReply{"OK"}) {}

    template <typename T,
              typename = std::enable_if_t<std::is_constructible_v<Variant, T&&> &&
                                          !std::is_same_v<std::decay_t<T>, Reply>>>
    Reply(T&& alternative) : value(std::forward<T>(alternative)) {}  // NOLINT(implicit)

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(value); }

    template <typename T>
    [[nodiscard]] const T& as() const { return std::get<T>(value); }

    [[nodiscard]] bool is_error() const noexcept { return is<ErrorReply>(); }

    Variant value;
};

bool operator==(const StatusReply& a, const StatusReply& b);
bool operator==(const ErrorReply& a, const ErrorReply& b);
bool operator==(const IntegerReply& a, const IntegerReply& b);
bool operator==(const BulkReply& a, const BulkReply& b);
bool operator==(const ArrayReply& a, const ArrayReply& b);
bool operator==(const Reply& a, const Reply& b);

// ── Reply builders ────────────────────────────────────────────────────────────

namespace reply {

[[nodiscard]] Reply ok();
[[nodiscard]] Reply status(std::string text);
[[nodiscard]] Reply error(std::string message);
[[nodiscard]] Reply integer(int64_t value);
[[nodiscard]] Reply bulk(std::string value);
[[nodiscard]] Reply nil_bulk();
[[nodiscard]] Reply array(std::vector<Reply> elements);
[[nodiscard]] Reply nil_array();

// Array of bulk strings.
[[nodiscard]] Reply bulk_array(const std::vector<std::string>& items);

} // namespace reply

// Human-readable rendering (redis-cli style), used by memkv-cli and test
// failure messages.
[[nodiscard]] std::string to_display_string(const Reply& r);

} // namespace memkv
