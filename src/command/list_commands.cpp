#include "command/arguments.hpp"
#include "command/blocking.hpp"
#include "command/command_table.hpp"

#include "common/errors.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace memkv::command {

namespace {

std::string pop_from(ListValue& list, ListEnd end) {
    std::string element;
    if (end == ListEnd::Head) {
        element = std::move(list.front());
        list.pop_front();
    } else {
        element = std::move(list.back());
        list.pop_back();
    }
    return element;
}

// ── Push / pop ────────────────────────────────────────────────────────────────

// LPUSH / RPUSH, and the X variants that only act on an existing list.
std::optional<Reply> generic_push(CommandContext& ctx, ListEnd end, bool only_existing) {
    const std::string& key = ctx.arg(1);
    ListValue* list = ctx.keyspace.find_as<ListValue>(key);
    if (list == nullptr) {
        if (only_existing) {
            return reply::integer(0);
        }
        list = &ctx.keyspace.find_or_create_as<ListValue>(key);
    }

    for (std::size_t i = 2; i < ctx.argc(); ++i) {
        if (end == ListEnd::Head) {
            list->push_front(ctx.arg(i));
        } else {
            list->push_back(ctx.arg(i));
        }
    }
    const auto size = static_cast<int64_t>(list->size());
    ctx.blocking.signal_key_ready(key);
    return reply::integer(size);
}

std::optional<Reply> generic_pop(CommandContext& ctx, ListEnd end) {
    const std::string& key = ctx.arg(1);
    ListValue* list = ctx.keyspace.find_as<ListValue>(key);
    if (list == nullptr) {
        return reply::nil_bulk();
    }
    std::string element = pop_from(*list, end);
    ctx.keyspace.remove_if_empty(key);
    return reply::bulk(std::move(element));
}

// BLPOP / BRPOP key [key ...] timeout
std::optional<Reply> generic_blocking_pop(CommandContext& ctx, ListEnd end) {
    const int64_t timeout_ms = parse_timeout_ms(ctx.arg(ctx.argc() - 1));

    std::vector<std::string> keys;
    for (std::size_t i = 1; i + 1 < ctx.argc(); ++i) {
        const std::string& key = ctx.arg(i);
        if (ListValue* list = ctx.keyspace.find_as<ListValue>(key)) {
            std::string element = pop_from(*list, end);
            ctx.keyspace.remove_if_empty(key);
            return reply::array({reply::bulk(key), reply::bulk(std::move(element))});
        }
        keys.push_back(key);
    }

    if (!ctx.client) {
        return reply::nil_array();
    }
    const int64_t deadline = timeout_ms == 0 ? 0 : ctx.now_ms() + timeout_ms;
    ctx.blocking.block(ctx.client, std::move(keys), deadline, end);
    return std::nullopt;
}

// ── Inspection ────────────────────────────────────────────────────────────────

std::optional<Reply> cmd_llen(CommandContext& ctx) {
    const auto* list = ctx.keyspace.find_as<ListValue>(ctx.arg(1));
    return reply::integer(list ? static_cast<int64_t>(list->size()) : 0);
}

std::optional<Reply> cmd_lrange(CommandContext& ctx) {
    const int64_t start = parse_integer(ctx.arg(2));
    const int64_t stop  = parse_integer(ctx.arg(3));

    const auto* list = ctx.keyspace.find_as<ListValue>(ctx.arg(1));
    std::vector<Reply> out;
    if (list != nullptr) {
        if (auto range = normalize_range(start, stop, list->size())) {
            out.reserve(range->stop - range->start + 1);
            for (std::size_t i = range->start; i <= range->stop; ++i) {
                out.push_back(reply::bulk((*list)[i]));
            }
        }
    }
    return reply::array(std::move(out));
}

std::optional<Reply> cmd_lindex(CommandContext& ctx) {
    const int64_t index = parse_integer(ctx.arg(2));
    const auto* list = ctx.keyspace.find_as<ListValue>(ctx.arg(1));
    if (list == nullptr) {
        return reply::nil_bulk();
    }
    const auto at = normalize_index(index, list->size());
    return at ? reply::bulk((*list)[*at]) : reply::nil_bulk();
}

// ── In-place modification ─────────────────────────────────────────────────────

std::optional<Reply> cmd_lset(CommandContext& ctx) {
    const int64_t index = parse_integer(ctx.arg(2));
    auto* list = ctx.keyspace.find_as<ListValue>(ctx.arg(1));
    if (list == nullptr) {
        throw no_such_key_error();
    }
    const auto at = normalize_index(index, list->size());
    if (!at) {
        throw invalid_argument_error("index out of range");
    }
    (*list)[*at] = ctx.arg(3);
    return reply::ok();
}

std::optional<Reply> cmd_ltrim(CommandContext& ctx) {
    const int64_t start = parse_integer(ctx.arg(2));
    const int64_t stop  = parse_integer(ctx.arg(3));

    const std::string& key = ctx.arg(1);
    auto* list = ctx.keyspace.find_as<ListValue>(key);
    if (list == nullptr) {
        return reply::ok();
    }
    if (auto range = normalize_range(start, stop, list->size())) {
        list->erase(list->begin() + static_cast<std::ptrdiff_t>(range->stop) + 1, list->end());
        list->erase(list->begin(), list->begin() + static_cast<std::ptrdiff_t>(range->start));
    } else {
        list->clear();
    }
    ctx.keyspace.remove_if_empty(key);
    return reply::ok();
}

// LREM key count value: count > 0 from the head, < 0 from the tail, 0 = all.
std::optional<Reply> cmd_lrem(CommandContext& ctx) {
    const int64_t count = parse_integer(ctx.arg(2));
    const std::string& key = ctx.arg(1);
    const std::string& target = ctx.arg(3);

    auto* list = ctx.keyspace.find_as<ListValue>(key);
    if (list == nullptr) {
        return reply::integer(0);
    }

    const uint64_t limit = count == 0 ? UINT64_MAX
                                      : (count > 0 ? static_cast<uint64_t>(count)
                                                   : 0 - static_cast<uint64_t>(count));
    uint64_t removed = 0;

    if (count >= 0) {
        for (auto it = list->begin(); it != list->end() && removed < limit;) {
            if (*it == target) {
                it = list->erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    } else {
        for (auto i = list->size(); i > 0 && removed < limit; --i) {
            if ((*list)[i - 1] == target) {
                list->erase(list->begin() + static_cast<std::ptrdiff_t>(i - 1));
                ++removed;
            }
        }
    }

    ctx.keyspace.remove_if_empty(key);
    return reply::integer(static_cast<int64_t>(removed));
}

// RPOPLPUSH source destination
std::optional<Reply> cmd_rpoplpush(CommandContext& ctx) {
    const std::string& src = ctx.arg(1);
    const std::string& dst = ctx.arg(2);

    auto* source = ctx.keyspace.find_as<ListValue>(src);
    if (source == nullptr) {
        return reply::nil_bulk();
    }
    // Type-check the destination before anything moves.
    (void)ctx.keyspace.find_as<ListValue>(dst);

    std::string element = pop_from(*source, ListEnd::Tail);
    if (src == dst) {
        source->push_front(element);
    } else {
        ctx.keyspace.remove_if_empty(src);
        ctx.keyspace.find_or_create_as<ListValue>(dst).push_front(element);
    }
    ctx.blocking.signal_key_ready(dst);
    return reply::bulk(std::move(element));
}

} // anonymous namespace

void register_list_commands(CommandTable& table) {
    const auto list_type = std::optional<ValueType>{ValueType::List};

    table.add({"lpush", 3, -1, 1, list_type, kFlagWrite, [](CommandContext& ctx) {
                   return generic_push(ctx, ListEnd::Head, false);
               }});
    table.add({"rpush", 3, -1, 1, list_type, kFlagWrite, [](CommandContext& ctx) {
                   return generic_push(ctx, ListEnd::Tail, false);
               }});
    table.add({"lpushx", 3, -1, 1, list_type, kFlagWrite, [](CommandContext& ctx) {
                   return generic_push(ctx, ListEnd::Head, true);
               }});
    table.add({"rpushx", 3, -1, 1, list_type, kFlagWrite, [](CommandContext& ctx) {
                   return generic_push(ctx, ListEnd::Tail, true);
               }});
    table.add({"lpop", 2, 2, 1, list_type, kFlagWrite, [](CommandContext& ctx) {
                   return generic_pop(ctx, ListEnd::Head);
               }});
    table.add({"rpop", 2, 2, 1, list_type, kFlagWrite, [](CommandContext& ctx) {
                   return generic_pop(ctx, ListEnd::Tail);
               }});

    table.add({"llen",   2, 2, 1, list_type, kFlagReadOnly, cmd_llen});
    table.add({"lrange", 4, 4, 1, list_type, kFlagReadOnly, cmd_lrange});
    table.add({"lindex", 3, 3, 1, list_type, kFlagReadOnly, cmd_lindex});
    table.add({"lset",   4, 4, 1, list_type, kFlagWrite,    cmd_lset});
    table.add({"ltrim",  4, 4, 1, list_type, kFlagWrite,    cmd_ltrim});
    table.add({"lrem",   4, 4, 1, list_type, kFlagWrite,    cmd_lrem});
    table.add({"rpoplpush", 3, 3, 1, list_type, kFlagWrite, cmd_rpoplpush});

    // Keys are type-checked one by one inside the handler.
    table.add({"blpop", 3, -1, 0, std::nullopt, kFlagWrite | kFlagBlocking,
               [](CommandContext& ctx) { return generic_blocking_pop(ctx, ListEnd::Head); }});
    table.add({"brpop", 3, -1, 0, std::nullopt, kFlagWrite | kFlagBlocking,
               [](CommandContext& ctx) { return generic_blocking_pop(ctx, ListEnd::Tail); }});
}

} // namespace memkv::command
