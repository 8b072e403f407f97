#include "common/errors.hpp"

#include <spdlog/fmt/fmt.h>

namespace memkv {

CommandError wrong_type_error() {
    return CommandError{ErrorKind::WrongType,
                        "Operation against a key holding the wrong kind of value"};
}

CommandError syntax_error() {
    return CommandError{ErrorKind::InvalidArgument, "syntax error"};
}

CommandError not_an_integer_error() {
    return CommandError{ErrorKind::InvalidArgument, "value is not an integer or out of range"};
}

CommandError not_a_float_error() {
    return CommandError{ErrorKind::InvalidArgument, "value is not a valid float"};
}

CommandError no_such_key_error() {
    return CommandError{ErrorKind::NoSuchKey, "no such key"};
}

CommandError unknown_command_error(std::string_view name) {
    return CommandError{ErrorKind::UnknownCommand,
                        fmt::format("unknown command '{}'", name)};
}

CommandError wrong_arity_error(std::string_view name) {
    return CommandError{ErrorKind::WrongArity,
                        fmt::format("wrong number of arguments for '{}' command", name)};
}

CommandError invalid_argument_error(std::string_view message) {
    return CommandError{ErrorKind::InvalidArgument, std::string(message)};
}

} // namespace memkv
