#include "command/arguments.hpp"
#include "command/command_table.hpp"

#include "common/errors.hpp"
#include "common/numeric.hpp"

#include <spdlog/fmt/fmt.h>

#include <limits>
#include <string>
#include <vector>

namespace memkv::command {

namespace {

constexpr std::size_t kMaxStringSize = 512ULL * 1024 * 1024;

[[nodiscard]] CommandError invalid_expire_error(const CommandContext& ctx) {
    return invalid_argument_error(
        fmt::format("invalid expire time in '{}' command", to_lower(ctx.arg(0))));
}

// Relative expire in ms from a positive integer argument in `unit_ms` units.
int64_t parse_positive_expire_ms(const CommandContext& ctx, const std::string& text,
                                 int64_t unit_ms) {
    const int64_t amount = parse_integer(text);
    int64_t ms = 0;
    int64_t when = 0;
    if (amount <= 0 || __builtin_mul_overflow(amount, unit_ms, &ms) ||
        __builtin_add_overflow(ms, ctx.now_ms(), &when)) {
        throw invalid_expire_error(ctx);
    }
    return ms;
}

void check_string_size(std::size_t size) {
    if (size > kMaxStringSize) {
        throw invalid_argument_error("string exceeds maximum allowed size");
    }
}

// ── GET / SET family ─────────────────────────────────────────────────────────

std::optional<Reply> cmd_get(CommandContext& ctx) {
    const auto* value = ctx.keyspace.find_as<StringValue>(ctx.arg(1));
    return value ? reply::bulk(*value) : reply::nil_bulk();
}

// SET key value [EX seconds | PX milliseconds] [NX | XX]
std::optional<Reply> cmd_set(CommandContext& ctx) {
    enum class Condition { None, IfAbsent, IfPresent };

    Condition condition = Condition::None;
    std::optional<int64_t> expire_ms;

    for (std::size_t i = 3; i < ctx.argc(); ++i) {
        const std::string option = to_lower(ctx.arg(i));
        const bool has_next = i + 1 < ctx.argc();

        if (option == "nx" && condition == Condition::None) {
            condition = Condition::IfAbsent;
        } else if (option == "xx" && condition == Condition::None) {
            condition = Condition::IfPresent;
        } else if (option == "ex" && !expire_ms && has_next) {
            expire_ms = parse_positive_expire_ms(ctx, ctx.arg(++i), 1000);
        } else if (option == "px" && !expire_ms && has_next) {
            expire_ms = parse_positive_expire_ms(ctx, ctx.arg(++i), 1);
        } else {
            throw syntax_error();
        }
    }

    const std::string& key = ctx.arg(1);
    if (condition != Condition::None) {
        const bool present = ctx.keyspace.exists(key);
        if ((condition == Condition::IfAbsent && present) ||
            (condition == Condition::IfPresent && !present)) {
            return reply::nil_bulk();
        }
    }

    ctx.keyspace.set(key, StringValue{ctx.arg(2)});
    if (expire_ms) {
        (void)ctx.keyspace.set_expire(key, ctx.now_ms() + *expire_ms);
    }
    return reply::ok();
}

std::optional<Reply> cmd_setnx(CommandContext& ctx) {
    if (ctx.keyspace.exists(ctx.arg(1))) {
        return reply::integer(0);
    }
    ctx.keyspace.set(ctx.arg(1), StringValue{ctx.arg(2)});
    return reply::integer(1);
}

// SETEX key seconds value / PSETEX key milliseconds value
std::optional<Reply> generic_setex(CommandContext& ctx, int64_t unit_ms) {
    const int64_t ms = parse_positive_expire_ms(ctx, ctx.arg(2), unit_ms);
    ctx.keyspace.set(ctx.arg(1), StringValue{ctx.arg(3)});
    (void)ctx.keyspace.set_expire(ctx.arg(1), ctx.now_ms() + ms);
    return reply::ok();
}

std::optional<Reply> cmd_getset(CommandContext& ctx) {
    const auto* old = ctx.keyspace.find_as<StringValue>(ctx.arg(1));
    Reply result = old ? reply::bulk(*old) : reply::nil_bulk();
    ctx.keyspace.set(ctx.arg(1), StringValue{ctx.arg(2)});
    return result;
}

std::optional<Reply> cmd_mget(CommandContext& ctx) {
    std::vector<Reply> values;
    values.reserve(ctx.argc() - 1);
    for (std::size_t i = 1; i < ctx.argc(); ++i) {
        const Value* v = ctx.keyspace.lookup(ctx.arg(i));
        const auto* s = v ? std::get_if<StringValue>(v) : nullptr;
        values.push_back(s ? reply::bulk(*s) : reply::nil_bulk());
    }
    return reply::array(std::move(values));
}

void check_pairs(const CommandContext& ctx) {
    if ((ctx.argc() - 1) % 2 != 0) {
        throw wrong_arity_error(to_lower(ctx.arg(0)));
    }
}

std::optional<Reply> cmd_mset(CommandContext& ctx) {
    check_pairs(ctx);
    for (std::size_t i = 1; i < ctx.argc(); i += 2) {
        ctx.keyspace.set(ctx.arg(i), StringValue{ctx.arg(i + 1)});
    }
    return reply::ok();
}

std::optional<Reply> cmd_msetnx(CommandContext& ctx) {
    check_pairs(ctx);
    for (std::size_t i = 1; i < ctx.argc(); i += 2) {
        if (ctx.keyspace.exists(ctx.arg(i))) {
            return reply::integer(0);
        }
    }
    for (std::size_t i = 1; i < ctx.argc(); i += 2) {
        ctx.keyspace.set(ctx.arg(i), StringValue{ctx.arg(i + 1)});
    }
    return reply::integer(1);
}

// ── Counters ──────────────────────────────────────────────────────────────────

// Adds `delta` to the integer stored at `key` (0 when absent).  The expiry,
// if any, is kept.
std::optional<Reply> increment_by(CommandContext& ctx, int64_t delta) {
    const std::string& key = ctx.arg(1);
    int64_t current = 0;
    if (const auto* value = ctx.keyspace.find_as<StringValue>(key)) {
        if (!parse_int64(*value, current)) {
            throw not_an_integer_error();
        }
    }
    const int64_t updated = checked_add(current, delta);
    ctx.keyspace.set_keep_ttl(key, StringValue{fmt::format("{}", updated)});
    return reply::integer(updated);
}

std::optional<Reply> cmd_decrby(CommandContext& ctx) {
    const int64_t delta = parse_integer(ctx.arg(2));
    if (delta == std::numeric_limits<int64_t>::min()) {
        throw invalid_argument_error("increment or decrement would overflow");
    }
    return increment_by(ctx, -delta);
}

// ── Byte-level operations ─────────────────────────────────────────────────────

std::optional<Reply> cmd_append(CommandContext& ctx) {
    const std::string& key = ctx.arg(1);
    const std::string& suffix = ctx.arg(2);
    auto* existing = ctx.keyspace.find_as<StringValue>(key);
    if (existing == nullptr) {
        ctx.keyspace.set(key, StringValue{suffix});
        return reply::integer(static_cast<int64_t>(suffix.size()));
    }
    check_string_size(existing->size() + suffix.size());
    existing->append(suffix);
    return reply::integer(static_cast<int64_t>(existing->size()));
}

std::optional<Reply> cmd_strlen(CommandContext& ctx) {
    const auto* value = ctx.keyspace.find_as<StringValue>(ctx.arg(1));
    return reply::integer(value ? static_cast<int64_t>(value->size()) : 0);
}

// GETRANGE key start end: both ends inclusive, negative from the end.
std::optional<Reply> cmd_getrange(CommandContext& ctx) {
    int64_t start = parse_integer(ctx.arg(2));
    int64_t end   = parse_integer(ctx.arg(3));

    const auto* value = ctx.keyspace.find_as<StringValue>(ctx.arg(1));
    if (value == nullptr || value->empty()) {
        return reply::bulk("");
    }
    const auto len = static_cast<int64_t>(value->size());
    if (start < 0 && end < 0 && start > end) {
        return reply::bulk("");
    }
    if (start < 0) start += len;
    if (end < 0) end += len;
    if (start < 0) start = 0;
    if (end < 0) end = 0;
    if (end >= len) end = len - 1;
    if (start > end) {
        return reply::bulk("");
    }
    return reply::bulk(value->substr(static_cast<std::size_t>(start),
                                     static_cast<std::size_t>(end - start + 1)));
}

// SETRANGE key offset value: overwrites from `offset`, zero-padding as needed.
std::optional<Reply> cmd_setrange(CommandContext& ctx) {
    const int64_t offset = parse_integer(ctx.arg(2));
    if (offset < 0) {
        throw invalid_argument_error("offset is out of range");
    }
    const std::string& key   = ctx.arg(1);
    const std::string& patch = ctx.arg(3);

    auto* existing = ctx.keyspace.find_as<StringValue>(key);
    if (patch.empty()) {
        return reply::integer(existing ? static_cast<int64_t>(existing->size()) : 0);
    }

    const auto at = static_cast<std::size_t>(offset);
    check_string_size(at + patch.size());

    if (existing == nullptr) {
        ctx.keyspace.set(key, StringValue{});
        existing = ctx.keyspace.find_as<StringValue>(key);
    }
    if (existing->size() < at + patch.size()) {
        existing->resize(at + patch.size(), '\0');
    }
    existing->replace(at, patch.size(), patch);
    return reply::integer(static_cast<int64_t>(existing->size()));
}

} // anonymous namespace

void register_string_commands(CommandTable& table) {
    const auto string_type = std::optional<ValueType>{ValueType::String};

    table.add({"get",    2, 2,  1, string_type,  kFlagReadOnly, cmd_get});
    table.add({"set",    3, -1, 1, std::nullopt, kFlagWrite,    cmd_set});
    table.add({"setnx",  3, 3,  1, std::nullopt, kFlagWrite,    cmd_setnx});
    table.add({"setex",  4, 4,  1, std::nullopt, kFlagWrite, [](CommandContext& ctx) {
                   return generic_setex(ctx, 1000);
               }});
    table.add({"psetex", 4, 4,  1, std::nullopt, kFlagWrite, [](CommandContext& ctx) {
                   return generic_setex(ctx, 1);
               }});
    table.add({"getset", 3, 3,  1, string_type,  kFlagWrite,    cmd_getset});
    table.add({"mget",   2, -1, 0, std::nullopt, kFlagReadOnly, cmd_mget});
    table.add({"mset",   3, -1, 0, std::nullopt, kFlagWrite,    cmd_mset});
    table.add({"msetnx", 3, -1, 0, std::nullopt, kFlagWrite,    cmd_msetnx});

    table.add({"incr", 2, 2, 1, string_type, kFlagWrite, [](CommandContext& ctx) {
                   return increment_by(ctx, 1);
               }});
    table.add({"decr", 2, 2, 1, string_type, kFlagWrite, [](CommandContext& ctx) {
                   return increment_by(ctx, -1);
               }});
    table.add({"incrby", 3, 3, 1, string_type, kFlagWrite, [](CommandContext& ctx) {
                   return increment_by(ctx, parse_integer(ctx.arg(2)));
               }});
    table.add({"decrby", 3, 3, 1, string_type, kFlagWrite, cmd_decrby});

    table.add({"append",   3, 3, 1, string_type, kFlagWrite,    cmd_append});
    table.add({"strlen",   2, 2, 1, string_type, kFlagReadOnly, cmd_strlen});
    table.add({"getrange", 4, 4, 1, string_type, kFlagReadOnly, cmd_getrange});
    table.add({"substr",   4, 4, 1, string_type, kFlagReadOnly, cmd_getrange});
    table.add({"setrange", 4, 4, 1, string_type, kFlagWrite,    cmd_setrange});
}

} // namespace memkv::command
