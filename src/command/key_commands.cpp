#include "command/arguments.hpp"
#include "command/blocking.hpp"
#include "command/command_table.hpp"

#include "common/errors.hpp"

#include <spdlog/fmt/fmt.h>

#include <string>

namespace memkv::command {

namespace {

std::optional<Reply> cmd_del(CommandContext& ctx) {
    int64_t removed = 0;
    for (std::size_t i = 1; i < ctx.argc(); ++i) {
        if (ctx.keyspace.del(ctx.arg(i))) {
            ++removed;
        }
    }
    return reply::integer(removed);
}

std::optional<Reply> cmd_exists(CommandContext& ctx) {
    int64_t found = 0;
    for (std::size_t i = 1; i < ctx.argc(); ++i) {
        if (ctx.keyspace.exists(ctx.arg(i))) {
            ++found;
        }
    }
    return reply::integer(found);
}

std::optional<Reply> cmd_type(CommandContext& ctx) {
    const auto type = ctx.keyspace.type_of(ctx.arg(1));
    return reply::status(type ? std::string(type_name(*type)) : std::string{"none"});
}

std::optional<Reply> cmd_keys(CommandContext& ctx) {
    return reply::bulk_array(ctx.keyspace.keys(ctx.arg(1)));
}

std::optional<Reply> cmd_randomkey(CommandContext& ctx) {
    auto key = ctx.keyspace.random_key();
    return key ? reply::bulk(std::move(*key)) : reply::nil_bulk();
}

void signal_if_list(CommandContext& ctx, const std::string& key) {
    if (ctx.keyspace.type_of(key) == ValueType::List) {
        ctx.blocking.signal_key_ready(key);
    }
}

std::optional<Reply> cmd_rename(CommandContext& ctx) {
    if (!ctx.keyspace.rename(ctx.arg(1), ctx.arg(2))) {
        throw no_such_key_error();
    }
    signal_if_list(ctx, ctx.arg(2));
    return reply::ok();
}

std::optional<Reply> cmd_renamenx(CommandContext& ctx) {
    if (!ctx.keyspace.exists(ctx.arg(1))) {
        throw no_such_key_error();
    }
    if (ctx.keyspace.exists(ctx.arg(2))) {
        return reply::integer(0);
    }
    (void)ctx.keyspace.rename(ctx.arg(1), ctx.arg(2));
    signal_if_list(ctx, ctx.arg(2));
    return reply::integer(1);
}

// ── Expiration ────────────────────────────────────────────────────────────────

enum class ExpireUnit { Seconds, Milliseconds };

// EXPIRE / PEXPIRE take a relative time, EXPIREAT / PEXPIREAT an absolute one.
std::optional<Reply> generic_expire(CommandContext& ctx, ExpireUnit unit, bool absolute) {
    const int64_t amount = parse_integer(ctx.arg(2));

    int64_t when_ms = amount;
    const bool overflow =
        (unit == ExpireUnit::Seconds && __builtin_mul_overflow(amount, int64_t{1000}, &when_ms)) ||
        (!absolute && __builtin_add_overflow(when_ms, ctx.now_ms(), &when_ms));
    if (overflow) {
        throw invalid_argument_error(
            fmt::format("invalid expire time in '{}' command", to_lower(ctx.arg(0))));
    }

    return reply::integer(ctx.keyspace.set_expire(ctx.arg(1), when_ms) ? 1 : 0);
}

std::optional<Reply> cmd_ttl(CommandContext& ctx) {
    const int64_t ms = ctx.keyspace.ttl_ms(ctx.arg(1));
    if (ms < 0) {
        return reply::integer(ms);
    }
    return reply::integer((ms + 500) / 1000);
}

std::optional<Reply> cmd_pttl(CommandContext& ctx) {
    return reply::integer(ctx.keyspace.ttl_ms(ctx.arg(1)));
}

std::optional<Reply> cmd_persist(CommandContext& ctx) {
    return reply::integer(ctx.keyspace.clear_expire(ctx.arg(1)) ? 1 : 0);
}

} // anonymous namespace

void register_key_commands(CommandTable& table) {
    table.add({"del",       2, -1, 1, std::nullopt, kFlagWrite,    cmd_del});
    table.add({"exists",    2, -1, 1, std::nullopt, kFlagReadOnly, cmd_exists});
    table.add({"type",      2, 2,  1, std::nullopt, kFlagReadOnly, cmd_type});
    table.add({"keys",      2, 2,  0, std::nullopt, kFlagReadOnly, cmd_keys});
    table.add({"randomkey", 1, 1,  0, std::nullopt, kFlagReadOnly, cmd_randomkey});
    table.add({"rename",    3, 3,  1, std::nullopt, kFlagWrite,    cmd_rename});
    table.add({"renamenx",  3, 3,  1, std::nullopt, kFlagWrite,    cmd_renamenx});

    table.add({"expire", 3, 3, 1, std::nullopt, kFlagWrite, [](CommandContext& ctx) {
                   return generic_expire(ctx, ExpireUnit::Seconds, false);
               }});
    table.add({"pexpire", 3, 3, 1, std::nullopt, kFlagWrite, [](CommandContext& ctx) {
                   return generic_expire(ctx, ExpireUnit::Milliseconds, false);
               }});
    table.add({"expireat", 3, 3, 1, std::nullopt, kFlagWrite, [](CommandContext& ctx) {
                   return generic_expire(ctx, ExpireUnit::Seconds, true);
               }});
    table.add({"pexpireat", 3, 3, 1, std::nullopt, kFlagWrite, [](CommandContext& ctx) {
                   return generic_expire(ctx, ExpireUnit::Milliseconds, true);
               }});

    table.add({"ttl",     2, 2, 1, std::nullopt, kFlagReadOnly, cmd_ttl});
    table.add({"pttl",    2, 2, 1, std::nullopt, kFlagReadOnly, cmd_pttl});
    table.add({"persist", 2, 2, 1, std::nullopt, kFlagWrite,    cmd_persist});
}

} // namespace memkv::command
