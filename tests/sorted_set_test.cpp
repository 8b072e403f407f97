#include "storage/sorted_set.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace memkv {

namespace {

std::vector<std::string> members(const std::vector<ScoredMember>& items) {
    std::vector<std::string> out;
    for (const auto& item : items) {
        out.push_back(item.member);
    }
    return out;
}

ScoreRange closed(double min, double max) {
    return ScoreRange{min, max, false, false};
}

} // namespace

// ── Fixture ───────────────────────────────────────────────────────────────────

class SortedSetTest : public ::testing::Test {
protected:
    void SetUp() override {
        zset_.insert_or_update("a", 1);
        zset_.insert_or_update("b", 2);
        zset_.insert_or_update("c", 3);
        zset_.insert_or_update("d", 4);
    }

    SortedSet zset_;
};

// ── insert / remove ───────────────────────────────────────────────────────────

TEST_F(SortedSetTest, InsertReportsNewMembersOnly) {
    EXPECT_TRUE(zset_.insert_or_update("e", 5));
    EXPECT_FALSE(zset_.insert_or_update("e", 6));
    EXPECT_EQ(zset_.size(), 5u);
    EXPECT_DOUBLE_EQ(*zset_.score_of("e"), 6);
}

TEST_F(SortedSetTest, UpdateMovesMemberToNewPosition) {
    zset_.insert_or_update("a", 10);
    EXPECT_EQ(members(zset_.range_by_rank(0, 3)),
              (std::vector<std::string>{"b", "c", "d", "a"}));
    EXPECT_EQ(*zset_.rank_of("a"), 3u);
}

TEST_F(SortedSetTest, RemoveDropsMemberFromBothIndexes) {
    EXPECT_TRUE(zset_.remove("b"));
    EXPECT_FALSE(zset_.remove("b"));
    EXPECT_FALSE(zset_.score_of("b").has_value());
    EXPECT_FALSE(zset_.rank_of("b").has_value());
    EXPECT_EQ(*zset_.rank_of("c"), 1u);
    EXPECT_EQ(zset_.size(), 3u);
}

TEST_F(SortedSetTest, EqualScoresOrderByMember) {
    SortedSet z;
    z.insert_or_update("zeta", 1);
    z.insert_or_update("alpha", 1);
    z.insert_or_update("mid", 1);
    EXPECT_EQ(members(z.range_by_rank(0, 2)),
              (std::vector<std::string>{"alpha", "mid", "zeta"}));
}

TEST_F(SortedSetTest, InfiniteScoresSortAtTheEnds) {
    zset_.insert_or_update("top", std::numeric_limits<double>::infinity());
    zset_.insert_or_update("bottom", -std::numeric_limits<double>::infinity());
    EXPECT_EQ(*zset_.rank_of("bottom"), 0u);
    EXPECT_EQ(*zset_.rank_of("top"), 5u);
}

// ── rank ──────────────────────────────────────────────────────────────────────

TEST_F(SortedSetTest, RankCountsFromEitherEnd) {
    EXPECT_EQ(*zset_.rank_of("a"), 0u);
    EXPECT_EQ(*zset_.rank_of("d"), 3u);
    EXPECT_EQ(*zset_.rank_of("a", true), 3u);
    EXPECT_EQ(*zset_.rank_of("d", true), 0u);
    EXPECT_FALSE(zset_.rank_of("missing").has_value());
}

TEST_F(SortedSetTest, RankStaysConsistentAcrossManyInserts) {
    SortedSet z;
    for (int i = 999; i >= 0; --i) {
        z.insert_or_update("m" + std::to_string(i), i);
    }
    for (int i = 0; i < 1000; i += 97) {
        EXPECT_EQ(*z.rank_of("m" + std::to_string(i)), static_cast<std::size_t>(i));
    }
}

// Reference model: member -> score, ordered on demand by (score, member).
class SortedSetModel {
public:
    void set(const std::string& member, double score) { scores_[member] = score; }
    void erase(const std::string& member) { scores_.erase(member); }

    [[nodiscard]] std::vector<std::pair<double, std::string>> ordered() const {
        std::vector<std::pair<double, std::string>> out;
        for (const auto& [member, score] : scores_) {
            out.emplace_back(score, member);
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    std::map<std::string, double> scores_;
};

TEST(SortedSetModelTest, RankInvariantHoldsUnderRandomMutation) {
    std::mt19937 rng(20240611);
    std::uniform_int_distribution<int> pick_member(0, 59);
    std::uniform_int_distribution<int> pick_score(-10, 10);   // few values: many ties
    std::uniform_int_distribution<int> pick_op(0, 99);

    SortedSet z;
    SortedSetModel model;

    for (int step = 0; step < 4000; ++step) {
        const std::string member = "m" + std::to_string(pick_member(rng));
        const double score = pick_score(rng);
        const int op = pick_op(rng);

        if (op < 45) {
            const bool added = z.insert_or_update(member, score);
            EXPECT_EQ(added, model.scores_.count(member) == 0);
            model.set(member, score);
        } else if (op < 65) {
            EXPECT_EQ(z.remove(member), model.scores_.erase(member) == 1);
        } else if (op < 85) {
            const double before = model.scores_.count(member) ? model.scores_[member] : 0.0;
            EXPECT_DOUBLE_EQ(z.increment_score(member, score), before + score);
            model.set(member, before + score);
        } else if (op < 93) {
            const auto ordered = model.ordered();
            const auto start = static_cast<std::size_t>(pick_member(rng) % 8);
            const auto stop = start + static_cast<std::size_t>(pick_member(rng) % 4);
            std::size_t expected = 0;
            for (std::size_t r = start; r <= stop && r < ordered.size(); ++r) {
                model.erase(ordered[r].second);
                ++expected;
            }
            EXPECT_EQ(z.remove_range_by_rank(start, stop), expected);
        } else {
            const ScoreRange range{score, score + 2, false, true};
            std::size_t expected = 0;
            for (const auto& [s, m] : model.ordered()) {
                if (range.contains(s)) {
                    model.erase(m);
                    ++expected;
                }
            }
            EXPECT_EQ(z.remove_range_by_score(range), expected);
        }

        ASSERT_EQ(z.size(), model.scores_.size()) << "step " << step;
        if (step % 50 != 0) {
            continue;
        }

        const auto ordered = model.ordered();
        for (std::size_t r = 0; r < ordered.size(); ++r) {
            const auto& [s, m] = ordered[r];
            ASSERT_EQ(z.rank_of(m), std::optional<std::size_t>(r)) << m << " at step " << step;
            ASSERT_EQ(z.rank_of(m, true), std::optional<std::size_t>(ordered.size() - 1 - r));
            ASSERT_EQ(z.score_of(m), std::optional<double>(s));
        }

        const ScoreRange window{-3, 4, true, false};
        const auto in_window = std::count_if(ordered.begin(), ordered.end(),
            [&](const auto& entry) { return window.contains(entry.first); });
        EXPECT_EQ(z.count_in_range(window), static_cast<std::size_t>(in_window));

        std::vector<std::string> walked;
        z.for_each([&](const std::string& m, double) { walked.push_back(m); });
        ASSERT_EQ(walked.size(), ordered.size());
        for (std::size_t r = 0; r < ordered.size(); ++r) {
            EXPECT_EQ(walked[r], ordered[r].second);
        }
    }
}

// ── increment ─────────────────────────────────────────────────────────────────

TEST_F(SortedSetTest, IncrementCreatesAbsentMember) {
    EXPECT_DOUBLE_EQ(zset_.increment_score("new", 2.5), 2.5);
    EXPECT_DOUBLE_EQ(zset_.increment_score("a", 5), 6);
    EXPECT_EQ(*zset_.rank_of("a"), 4u);
}

// ── ranges ────────────────────────────────────────────────────────────────────

TEST_F(SortedSetTest, RangeByRankReverse) {
    EXPECT_EQ(members(zset_.range_by_rank(0, 1, true)),
              (std::vector<std::string>{"d", "c"}));
}

TEST_F(SortedSetTest, RangeByScoreHonoursExclusiveBounds) {
    EXPECT_EQ(members(zset_.range_by_score(closed(2, 3))),
              (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(members(zset_.range_by_score(ScoreRange{2, 4, true, true})),
              (std::vector<std::string>{"c"}));
}

TEST_F(SortedSetTest, RangeByScoreReverseWithOffsetAndLimit) {
    const auto all = closed(-std::numeric_limits<double>::infinity(),
                            std::numeric_limits<double>::infinity());
    EXPECT_EQ(members(zset_.range_by_score(all, true, 1, 2)),
              (std::vector<std::string>{"c", "b"}));
    EXPECT_EQ(members(zset_.range_by_score(all, false, 3, -1)),
              (std::vector<std::string>{"d"}));
    EXPECT_TRUE(zset_.range_by_score(all, false, 10, -1).empty());
}

TEST_F(SortedSetTest, EmptyRangeYieldsNothing) {
    EXPECT_TRUE(zset_.range_by_score(closed(3, 2)).empty());
    EXPECT_TRUE(zset_.range_by_score(ScoreRange{2, 2, true, false}).empty());
    EXPECT_EQ(zset_.count_in_range(closed(3, 2)), 0u);
}

TEST_F(SortedSetTest, CountInRange) {
    EXPECT_EQ(zset_.count_in_range(closed(1, 4)), 4u);
    EXPECT_EQ(zset_.count_in_range(ScoreRange{1, 4, true, false}), 3u);
    EXPECT_EQ(zset_.count_in_range(closed(10, 20)), 0u);
}

// ── range removal ─────────────────────────────────────────────────────────────

TEST_F(SortedSetTest, RemoveRangeByRank) {
    EXPECT_EQ(zset_.remove_range_by_rank(1, 2), 2u);
    EXPECT_EQ(members(zset_.range_by_rank(0, 1)), (std::vector<std::string>{"a", "d"}));
    EXPECT_FALSE(zset_.score_of("b").has_value());
}

TEST_F(SortedSetTest, RemoveRangeByScore) {
    EXPECT_EQ(zset_.remove_range_by_score(ScoreRange{1, 3, true, false}), 2u);
    EXPECT_EQ(zset_.size(), 2u);
    EXPECT_TRUE(zset_.score_of("a").has_value());
    EXPECT_TRUE(zset_.score_of("d").has_value());
}

// ── move / iteration ──────────────────────────────────────────────────────────

TEST_F(SortedSetTest, MoveTransfersOwnership) {
    SortedSet moved = std::move(zset_);
    EXPECT_EQ(moved.size(), 4u);
    EXPECT_EQ(*moved.rank_of("c"), 2u);
}

TEST_F(SortedSetTest, MoveAssignReplacesContents) {
    SortedSet other;
    other.insert_or_update("x", 10);
    other = std::move(zset_);
    EXPECT_EQ(other.size(), 4u);
    EXPECT_FALSE(other.score_of("x").has_value());
    EXPECT_EQ(*other.rank_of("d"), 3u);
}

TEST_F(SortedSetTest, ForEachVisitsInAscendingOrder) {
    std::vector<double> scores;
    zset_.for_each([&](const std::string&, double score) { scores.push_back(score); });
    EXPECT_EQ(scores, (std::vector<double>{1, 2, 3, 4}));
}

// ── parse_score_bound ─────────────────────────────────────────────────────────

TEST(ScoreBoundTest, ParsesInclusiveExclusiveAndInfinite) {
    double v = 0;
    bool excl = false;
    ASSERT_TRUE(parse_score_bound("1.5", v, excl));
    EXPECT_DOUBLE_EQ(v, 1.5);
    EXPECT_FALSE(excl);

    ASSERT_TRUE(parse_score_bound("(3", v, excl));
    EXPECT_DOUBLE_EQ(v, 3);
    EXPECT_TRUE(excl);

    ASSERT_TRUE(parse_score_bound("-inf", v, excl));
    EXPECT_TRUE(std::isinf(v));
    EXPECT_LT(v, 0);
}

TEST(ScoreBoundTest, RejectsGarbageAndNaN) {
    double v = 0;
    bool excl = false;
    EXPECT_FALSE(parse_score_bound("abc", v, excl));
    EXPECT_FALSE(parse_score_bound("(", v, excl));
    EXPECT_FALSE(parse_score_bound("nan", v, excl));
    EXPECT_FALSE(parse_score_bound("", v, excl));
}

} // namespace memkv
