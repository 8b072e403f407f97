#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace memkv {

// ── Error kinds ───────────────────────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    Protocol,         // malformed frame, oversized argument – connection-fatal
    UnknownCommand,
    WrongArity,
    WrongType,        // stored variant does not match the command's type
    InvalidArgument,  // bad number, NaN score, bad range bound, bad option
    NoSuchKey,        // command distinguishes "absent" as an error
};

// ── CommandError ──────────────────────────────────────────────────────────────
//
// Thrown by command handlers and Keyspace accessors.  Caught only at the
// Dispatcher boundary and converted into an error reply of the form
// "<CATEGORY> <message>".

class CommandError : public std::runtime_error {
public:
    CommandError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    // Machine-stable category word: "WRONGTYPE" or "ERR".
    [[nodiscard]] std::string_view category() const noexcept {
        return kind_ == ErrorKind::WrongType ? "WRONGTYPE" : "ERR";
    }

    // Full reply text, e.g. "ERR syntax error".
    [[nodiscard]] std::string reply_text() const {
        return std::string(category()) + " " + what();
    }

private:
    ErrorKind kind_;
};

// ── ProtocolError ─────────────────────────────────────────────────────────────
//
// Thrown by the request parser.  The session reports it and closes the
// connection.

class ProtocolError : public CommandError {
public:
    explicit ProtocolError(const std::string& message)
        : CommandError(ErrorKind::Protocol, message) {}
};

// ── Canned errors ─────────────────────────────────────────────────────────────

[[nodiscard]] CommandError wrong_type_error();
[[nodiscard]] CommandError syntax_error();
[[nodiscard]] CommandError not_an_integer_error();
[[nodiscard]] CommandError not_a_float_error();
[[nodiscard]] CommandError no_such_key_error();
[[nodiscard]] CommandError unknown_command_error(std::string_view name);
[[nodiscard]] CommandError wrong_arity_error(std::string_view name);

// Any other argument validation failure; `message` excludes the "ERR" word.
[[nodiscard]] CommandError invalid_argument_error(std::string_view message);

} // namespace memkv
