#include "command/arguments.hpp"
#include "command/command_table.hpp"
#include "storage/random_pick.hpp"

#include "common/errors.hpp"

#include <algorithm>
#include <random>
#include <string>
#include <vector>

namespace memkv::command {

namespace {

// Largest |count| accepted by SRANDMEMBER with a negative count; matches the
// default multi-bulk limit so the reply stays within what a request may carry.
constexpr uint64_t kMaxRandomPicks = 1024 * 1024;

std::minstd_rand& set_rng() {
    static std::minstd_rand rng{std::random_device{}()};
    return rng;
}

std::vector<std::string> members_of(const SetValue& set) {
    return {set.begin(), set.end()};
}

// ── Single-set operations ─────────────────────────────────────────────────────

std::optional<Reply> cmd_sadd(CommandContext& ctx) {
    auto& set = ctx.keyspace.find_or_create_as<SetValue>(ctx.arg(1));
    int64_t added = 0;
    for (std::size_t i = 2; i < ctx.argc(); ++i) {
        if (set.insert(ctx.arg(i)).second) {
            ++added;
        }
    }
    return reply::integer(added);
}

std::optional<Reply> cmd_srem(CommandContext& ctx) {
    auto* set = ctx.keyspace.find_as<SetValue>(ctx.arg(1));
    if (set == nullptr) {
        return reply::integer(0);
    }
    int64_t removed = 0;
    for (std::size_t i = 2; i < ctx.argc(); ++i) {
        removed += static_cast<int64_t>(set->erase(ctx.arg(i)));
    }
    ctx.keyspace.remove_if_empty(ctx.arg(1));
    return reply::integer(removed);
}

std::optional<Reply> cmd_sismember(CommandContext& ctx) {
    const auto* set = ctx.keyspace.find_as<SetValue>(ctx.arg(1));
    return reply::integer(set && set->count(ctx.arg(2)) ? 1 : 0);
}

std::optional<Reply> cmd_scard(CommandContext& ctx) {
    const auto* set = ctx.keyspace.find_as<SetValue>(ctx.arg(1));
    return reply::integer(set ? static_cast<int64_t>(set->size()) : 0);
}

std::optional<Reply> cmd_smembers(CommandContext& ctx) {
    const auto* set = ctx.keyspace.find_as<SetValue>(ctx.arg(1));
    return reply::bulk_array(set ? members_of(*set) : std::vector<std::string>{});
}

std::optional<Reply> cmd_spop(CommandContext& ctx) {
    auto* set = ctx.keyspace.find_as<SetValue>(ctx.arg(1));
    if (set == nullptr) {
        return reply::nil_bulk();
    }
    std::string member = random_element(*set, set_rng());
    set->erase(member);
    ctx.keyspace.remove_if_empty(ctx.arg(1));
    return reply::bulk(std::move(member));
}

// SRANDMEMBER key [count]: positive count = distinct members, negative count
// = |count| picks that may repeat.
std::optional<Reply> cmd_srandmember(CommandContext& ctx) {
    std::optional<int64_t> count;
    if (ctx.argc() == 3) {
        count = parse_integer(ctx.arg(2));
    }

    const auto* set = ctx.keyspace.find_as<SetValue>(ctx.arg(1));
    if (!count) {
        return set ? reply::bulk(random_element(*set, set_rng())) : reply::nil_bulk();
    }
    if (set == nullptr || *count == 0) {
        return reply::array({});
    }

    auto& rng = set_rng();
    std::vector<std::string> picked;

    if (*count < 0) {
        const uint64_t n = 0 - static_cast<uint64_t>(*count);
        if (n > kMaxRandomPicks) {
            throw not_an_integer_error();
        }
        picked.reserve(static_cast<std::size_t>(n));
        for (uint64_t i = 0; i < n; ++i) {
            picked.push_back(random_element(*set, rng));
        }
    } else if (static_cast<uint64_t>(*count) >= set->size()) {
        picked = members_of(*set);
    } else {
        picked = members_of(*set);
        std::shuffle(picked.begin(), picked.end(), rng);
        picked.resize(static_cast<std::size_t>(*count));
    }
    return reply::bulk_array(picked);
}

// SMOVE source destination member
std::optional<Reply> cmd_smove(CommandContext& ctx) {
    const std::string& src = ctx.arg(1);
    const std::string& dst = ctx.arg(2);
    const std::string& member = ctx.arg(3);

    auto* source = ctx.keyspace.find_as<SetValue>(src);
    (void)ctx.keyspace.find_as<SetValue>(dst);   // WRONGTYPE before any change

    if (source == nullptr || source->count(member) == 0) {
        return reply::integer(0);
    }
    if (src == dst) {
        return reply::integer(1);
    }
    source->erase(member);
    ctx.keyspace.remove_if_empty(src);
    ctx.keyspace.find_or_create_as<SetValue>(dst).insert(member);
    return reply::integer(1);
}

// ── Multi-set algebra ─────────────────────────────────────────────────────────

enum class SetOp { Intersection, Union, Difference };

// Computes `op` over the sets named by args[first..].  Missing keys are empty
// sets; a key of another type is WRONGTYPE.
SetValue combine(CommandContext& ctx, std::size_t first, SetOp op) {
    std::vector<const SetValue*> sets;
    for (std::size_t i = first; i < ctx.argc(); ++i) {
        sets.push_back(ctx.keyspace.find_as<SetValue>(ctx.arg(i)));
    }

    SetValue result;
    switch (op) {
        case SetOp::Intersection: {
            if (std::any_of(sets.begin(), sets.end(), [](const SetValue* s) { return s == nullptr; })) {
                return result;
            }
            // Probe from the smallest set.
            auto smallest = std::min_element(sets.begin(), sets.end(),
                [](const SetValue* a, const SetValue* b) { return a->size() < b->size(); });
            for (const auto& member : **smallest) {
                const bool everywhere = std::all_of(sets.begin(), sets.end(),
                    [&member](const SetValue* s) { return s->count(member) != 0; });
                if (everywhere) {
                    result.insert(member);
                }
            }
            break;
        }
        case SetOp::Union:
            for (const SetValue* s : sets) {
                if (s != nullptr) {
                    result.insert(s->begin(), s->end());
                }
            }
            break;
        case SetOp::Difference:
            if (sets.front() == nullptr) {
                return result;
            }
            for (const auto& member : *sets.front()) {
                const bool elsewhere = std::any_of(sets.begin() + 1, sets.end(),
                    [&member](const SetValue* s) { return s != nullptr && s->count(member) != 0; });
                if (!elsewhere) {
                    result.insert(member);
                }
            }
            break;
    }
    return result;
}

std::optional<Reply> generic_set_op(CommandContext& ctx, SetOp op) {
    return reply::bulk_array(members_of(combine(ctx, 1, op)));
}

// SINTERSTORE / SUNIONSTORE / SDIFFSTORE destination key [key ...]
std::optional<Reply> generic_set_op_store(CommandContext& ctx, SetOp op) {
    SetValue result = combine(ctx, 2, op);
    const auto size = static_cast<int64_t>(result.size());
    const std::string& dst = ctx.arg(1);
    if (result.empty()) {
        ctx.keyspace.del(dst);
    } else {
        ctx.keyspace.set(dst, std::move(result));
    }
    return reply::integer(size);
}

} // anonymous namespace

void register_set_commands(CommandTable& table) {
    const auto set_type = std::optional<ValueType>{ValueType::Set};

    table.add({"sadd",        3, -1, 1, set_type, kFlagWrite,    cmd_sadd});
    table.add({"srem",        3, -1, 1, set_type, kFlagWrite,    cmd_srem});
    table.add({"sismember",   3, 3,  1, set_type, kFlagReadOnly, cmd_sismember});
    table.add({"scard",       2, 2,  1, set_type, kFlagReadOnly, cmd_scard});
    table.add({"smembers",    2, 2,  1, set_type, kFlagReadOnly, cmd_smembers});
    table.add({"spop",        2, 2,  1, set_type, kFlagWrite,    cmd_spop});
    table.add({"srandmember", 2, 3,  1, set_type, kFlagReadOnly, cmd_srandmember});
    table.add({"smove",       4, 4,  1, set_type, kFlagWrite,    cmd_smove});

    table.add({"sinter", 2, -1, 1, set_type, kFlagReadOnly, [](CommandContext& ctx) {
                   return generic_set_op(ctx, SetOp::Intersection);
               }});
    table.add({"sunion", 2, -1, 1, set_type, kFlagReadOnly, [](CommandContext& ctx) {
                   return generic_set_op(ctx, SetOp::Union);
               }});
    table.add({"sdiff", 2, -1, 1, set_type, kFlagReadOnly, [](CommandContext& ctx) {
                   return generic_set_op(ctx, SetOp::Difference);
               }});

    // The destination is overwritten whatever its type.
    table.add({"sinterstore", 3, -1, 0, std::nullopt, kFlagWrite, [](CommandContext& ctx) {
                   return generic_set_op_store(ctx, SetOp::Intersection);
               }});
    table.add({"sunionstore", 3, -1, 0, std::nullopt, kFlagWrite, [](CommandContext& ctx) {
                   return generic_set_op_store(ctx, SetOp::Union);
               }});
    table.add({"sdiffstore", 3, -1, 0, std::nullopt, kFlagWrite, [](CommandContext& ctx) {
                   return generic_set_op_store(ctx, SetOp::Difference);
               }});
}

} // namespace memkv::command
