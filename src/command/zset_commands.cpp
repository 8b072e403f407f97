#include "command/arguments.hpp"
#include "command/command_table.hpp"

#include "common/errors.hpp"
#include "common/numeric.hpp"

#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace memkv::command {

namespace {

Reply scored_reply(const std::vector<ScoredMember>& items, bool with_scores) {
    std::vector<Reply> out;
    out.reserve(items.size() * (with_scores ? 2 : 1));
    for (const auto& item : items) {
        out.push_back(reply::bulk(item.member));
        if (with_scores) {
            out.push_back(reply::bulk(format_double(item.score)));
        }
    }
    return reply::array(std::move(out));
}

// ── Membership ────────────────────────────────────────────────────────────────

// ZADD key score member [score member ...]
std::optional<Reply> cmd_zadd(CommandContext& ctx) {
    if ((ctx.argc() - 2) % 2 != 0) {
        throw syntax_error();
    }
    std::vector<std::pair<double, const std::string*>> pairs;
    pairs.reserve((ctx.argc() - 2) / 2);
    for (std::size_t i = 2; i < ctx.argc(); i += 2) {
        pairs.emplace_back(parse_float(ctx.arg(i)), &ctx.arg(i + 1));
    }

    auto& zset = ctx.keyspace.find_or_create_as<SortedSet>(ctx.arg(1));
    int64_t added = 0;
    for (const auto& [score, member] : pairs) {
        if (zset.insert_or_update(*member, score)) {
            ++added;
        }
    }
    return reply::integer(added);
}

std::optional<Reply> cmd_zrem(CommandContext& ctx) {
    auto* zset = ctx.keyspace.find_as<SortedSet>(ctx.arg(1));
    if (zset == nullptr) {
        return reply::integer(0);
    }
    int64_t removed = 0;
    for (std::size_t i = 2; i < ctx.argc(); ++i) {
        if (zset->remove(ctx.arg(i))) {
            ++removed;
        }
    }
    ctx.keyspace.remove_if_empty(ctx.arg(1));
    return reply::integer(removed);
}

std::optional<Reply> cmd_zscore(CommandContext& ctx) {
    const auto* zset = ctx.keyspace.find_as<SortedSet>(ctx.arg(1));
    const auto score = zset ? zset->score_of(ctx.arg(2)) : std::nullopt;
    return score ? reply::bulk(format_double(*score)) : reply::nil_bulk();
}

// ZINCRBY key increment member
std::optional<Reply> cmd_zincrby(CommandContext& ctx) {
    const double delta = parse_float(ctx.arg(2));
    const std::string& member = ctx.arg(3);

    auto* existing = ctx.keyspace.find_as<SortedSet>(ctx.arg(1));
    const double current = existing ? existing->score_of(member).value_or(0.0) : 0.0;
    if (std::isnan(current + delta)) {
        throw invalid_argument_error("resulting score is not a number (NaN)");
    }

    auto& zset = ctx.keyspace.find_or_create_as<SortedSet>(ctx.arg(1));
    return reply::bulk(format_double(zset.increment_score(member, delta)));
}

std::optional<Reply> cmd_zcard(CommandContext& ctx) {
    const auto* zset = ctx.keyspace.find_as<SortedSet>(ctx.arg(1));
    return reply::integer(zset ? static_cast<int64_t>(zset->size()) : 0);
}

std::optional<Reply> cmd_zcount(CommandContext& ctx) {
    const ScoreRange range = parse_score_range(ctx.arg(2), ctx.arg(3));
    const auto* zset = ctx.keyspace.find_as<SortedSet>(ctx.arg(1));
    return reply::integer(zset ? static_cast<int64_t>(zset->count_in_range(range)) : 0);
}

std::optional<Reply> generic_zrank(CommandContext& ctx, bool reverse) {
    const auto* zset = ctx.keyspace.find_as<SortedSet>(ctx.arg(1));
    const auto rank = zset ? zset->rank_of(ctx.arg(2), reverse) : std::nullopt;
    return rank ? reply::integer(static_cast<int64_t>(*rank)) : reply::nil_bulk();
}

// ── Ranges ────────────────────────────────────────────────────────────────────

// ZRANGE / ZREVRANGE key start stop [WITHSCORES]
std::optional<Reply> generic_zrange(CommandContext& ctx, bool reverse) {
    const int64_t start = parse_integer(ctx.arg(2));
    const int64_t stop  = parse_integer(ctx.arg(3));
    bool with_scores = false;
    if (ctx.argc() == 5) {
        if (!iequals(ctx.arg(4), "withscores")) {
            throw syntax_error();
        }
        with_scores = true;
    }

    const auto* zset = ctx.keyspace.find_as<SortedSet>(ctx.arg(1));
    if (zset == nullptr) {
        return reply::array({});
    }
    const auto range = normalize_range(start, stop, zset->size());
    if (!range) {
        return reply::array({});
    }
    return scored_reply(zset->range_by_rank(range->start, range->stop, reverse), with_scores);
}

// ZRANGEBYSCORE key min max [WITHSCORES] [LIMIT offset count]
// ZREVRANGEBYSCORE key max min [WITHSCORES] [LIMIT offset count]
std::optional<Reply> generic_zrange_by_score(CommandContext& ctx, bool reverse) {
    const ScoreRange range = reverse ? parse_score_range(ctx.arg(3), ctx.arg(2))
                                     : parse_score_range(ctx.arg(2), ctx.arg(3));
    bool with_scores = false;
    int64_t offset = 0;
    int64_t limit  = -1;

    for (std::size_t i = 4; i < ctx.argc(); ++i) {
        if (iequals(ctx.arg(i), "withscores")) {
            with_scores = true;
        } else if (iequals(ctx.arg(i), "limit") && i + 2 < ctx.argc()) {
            offset = parse_integer(ctx.arg(i + 1));
            limit  = parse_integer(ctx.arg(i + 2));
            i += 2;
        } else {
            throw syntax_error();
        }
    }

    const auto* zset = ctx.keyspace.find_as<SortedSet>(ctx.arg(1));
    if (zset == nullptr || offset < 0 || limit == 0) {
        return reply::array({});
    }
    return scored_reply(
        zset->range_by_score(range, reverse, static_cast<std::size_t>(offset), limit),
        with_scores);
}

std::optional<Reply> cmd_zremrangebyrank(CommandContext& ctx) {
    const int64_t start = parse_integer(ctx.arg(2));
    const int64_t stop  = parse_integer(ctx.arg(3));

    auto* zset = ctx.keyspace.find_as<SortedSet>(ctx.arg(1));
    if (zset == nullptr) {
        return reply::integer(0);
    }
    const auto range = normalize_range(start, stop, zset->size());
    if (!range) {
        return reply::integer(0);
    }
    const std::size_t removed = zset->remove_range_by_rank(range->start, range->stop);
    ctx.keyspace.remove_if_empty(ctx.arg(1));
    return reply::integer(static_cast<int64_t>(removed));
}

std::optional<Reply> cmd_zremrangebyscore(CommandContext& ctx) {
    const ScoreRange range = parse_score_range(ctx.arg(2), ctx.arg(3));
    auto* zset = ctx.keyspace.find_as<SortedSet>(ctx.arg(1));
    if (zset == nullptr) {
        return reply::integer(0);
    }
    const std::size_t removed = zset->remove_range_by_score(range);
    ctx.keyspace.remove_if_empty(ctx.arg(1));
    return reply::integer(static_cast<int64_t>(removed));
}

} // anonymous namespace

void register_zset_commands(CommandTable& table) {
    const auto zset_type = std::optional<ValueType>{ValueType::SortedSet};

    table.add({"zadd",    4, -1, 1, zset_type, kFlagWrite,    cmd_zadd});
    table.add({"zrem",    3, -1, 1, zset_type, kFlagWrite,    cmd_zrem});
    table.add({"zscore",  3, 3,  1, zset_type, kFlagReadOnly, cmd_zscore});
    table.add({"zincrby", 4, 4,  1, zset_type, kFlagWrite,    cmd_zincrby});
    table.add({"zcard",   2, 2,  1, zset_type, kFlagReadOnly, cmd_zcard});
    table.add({"zcount",  4, 4,  1, zset_type, kFlagReadOnly, cmd_zcount});

    table.add({"zrank", 3, 3, 1, zset_type, kFlagReadOnly, [](CommandContext& ctx) {
                   return generic_zrank(ctx, false);
               }});
    table.add({"zrevrank", 3, 3, 1, zset_type, kFlagReadOnly, [](CommandContext& ctx) {
                   return generic_zrank(ctx, true);
               }});
    table.add({"zrange", 4, 5, 1, zset_type, kFlagReadOnly, [](CommandContext& ctx) {
                   return generic_zrange(ctx, false);
               }});
    table.add({"zrevrange", 4, 5, 1, zset_type, kFlagReadOnly, [](CommandContext& ctx) {
                   return generic_zrange(ctx, true);
               }});
    table.add({"zrangebyscore", 4, -1, 1, zset_type, kFlagReadOnly, [](CommandContext& ctx) {
                   return generic_zrange_by_score(ctx, false);
               }});
    table.add({"zrevrangebyscore", 4, -1, 1, zset_type, kFlagReadOnly, [](CommandContext& ctx) {
                   return generic_zrange_by_score(ctx, true);
               }});

    table.add({"zremrangebyrank",  4, 4, 1, zset_type, kFlagWrite, cmd_zremrangebyrank});
    table.add({"zremrangebyscore", 4, 4, 1, zset_type, kFlagWrite, cmd_zremrangebyscore});
}

} // namespace memkv::command
