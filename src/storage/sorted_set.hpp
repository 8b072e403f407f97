#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace memkv {

// ── ScoreRange ────────────────────────────────────────────────────────────────
//
// Score interval with independently exclusive bounds.  Textual form used by
// ZRANGEBYSCORE & co: "1.5", "(1.5" (exclusive), "-inf", "+inf".

struct ScoreRange {
    double min = 0;
    double max = 0;
    bool   min_exclusive = false;
    bool   max_exclusive = false;

    [[nodiscard]] bool above_min(double score) const noexcept {
        return min_exclusive ? score > min : score >= min;
    }
    [[nodiscard]] bool below_max(double score) const noexcept {
        return max_exclusive ? score < max : score <= max;
    }
    [[nodiscard]] bool contains(double score) const noexcept {
        return above_min(score) && below_max(score);
    }
    // True when no score can satisfy both bounds.
    [[nodiscard]] bool empty() const noexcept {
        return min > max || (min == max && (min_exclusive || max_exclusive));
    }
};

// Parse one bound ("(1.5", "-inf", "3").  Returns false on a malformed or
// NaN bound.
[[nodiscard]] bool parse_score_bound(std::string_view text, double& value, bool& exclusive);

// ── ScoredMember ──────────────────────────────────────────────────────────────

struct ScoredMember {
    std::string member;
    double      score;
};

// ── SortedSet ─────────────────────────────────────────────────────────────────
//
// Ordered index behind the zset type.  Two coordinated structures:
//
//   * a skip list over (score, member) with per-level spans, giving O(log N)
//     insert / remove / rank and ordered range scans;
//   * a hash map member → score for O(1) point lookups.
//
// Order: ascending score, ties broken by ascending bytewise member.
// Ranks are zero-based positions in that order.  Callers reject NaN scores
// before they get here.
//
// Move-only.  dict_ owns the nodes; skip-list links never do.

class SortedSet {
public:
    SortedSet();
    ~SortedSet() = default;

    SortedSet(const SortedSet&)            = delete;
    SortedSet& operator=(const SortedSet&) = delete;

    SortedSet(SortedSet&& other) noexcept;
    SortedSet& operator=(SortedSet&& other) noexcept;

    // Adds `member` or moves it to `score`.  Returns true if it was added.
    bool insert_or_update(const std::string& member, double score);

    // Returns true if `member` was present.
    bool remove(const std::string& member);

    [[nodiscard]] std::optional<double> score_of(const std::string& member) const;

    // Zero-based rank, counted from the highest score when `reverse`.
    [[nodiscard]] std::optional<std::size_t> rank_of(const std::string& member,
                                                     bool reverse = false) const;

    // Adds `delta` to the member's score (0 if absent) and returns the new
    // score.  The caller checks the result for NaN before calling.
    double increment_score(const std::string& member, double delta);

    // Members at ranks [start, stop] (inclusive, already clamped and
    // non-negative).  With `reverse`, rank 0 is the highest score.
    [[nodiscard]] std::vector<ScoredMember> range_by_rank(std::size_t start, std::size_t stop,
                                                          bool reverse = false) const;

    // Members inside `range`, skipping `offset` matches and returning at most
    // `limit` (negative = unlimited).  With `reverse`, highest score first.
    [[nodiscard]] std::vector<ScoredMember> range_by_score(const ScoreRange& range,
                                                           bool reverse = false,
                                                           std::size_t offset = 0,
                                                           int64_t limit = -1) const;

    [[nodiscard]] std::size_t count_in_range(const ScoreRange& range) const;

    // Removes ranks [start, stop] (inclusive, clamped).  Returns removed count.
    std::size_t remove_range_by_rank(std::size_t start, std::size_t stop);

    // Removes members inside `range`.  Returns removed count.
    std::size_t remove_range_by_score(const ScoreRange& range);

    [[nodiscard]] std::size_t size() const noexcept { return length_; }
    [[nodiscard]] bool empty() const noexcept { return length_ == 0; }

    // Visits every member in ascending order.
    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (const Node* x = head_->levels[0].forward; x != nullptr; x = x->levels[0].forward) {
            fn(x->member, x->score);
        }
    }

private:
    static constexpr int    kMaxLevel    = 32;
    static constexpr double kProbability = 0.25;

    struct Node;

    struct Level {
        Node*       forward = nullptr;
        std::size_t span    = 0;   // nodes skipped by following `forward`
    };

    struct Node {
        Node(int level, std::string m, double s)
            : member(std::move(m)), score(s), levels(static_cast<std::size_t>(level)) {}

        std::string        member;
        double             score;
        Node*              backward = nullptr;
        std::vector<Level> levels;
    };

    [[nodiscard]] static bool less(double s1, std::string_view m1,
                                   double s2, std::string_view m2) noexcept {
        return s1 < s2 || (s1 == s2 && m1 < m2);
    }

    int random_level();

    // Links `x` at the position given by its score and member.
    void list_link(Node* x);
    // Unlinks `x`, which must be in the list; ownership is unaffected.
    void list_unlink(Node* x);
    void list_delete_node(Node* x, Node** update);

    // Unlinks `x` and frees it through dict_.
    void erase_node(Node* x, Node** update);

    // 1-based rank of (score, member) in the skip list, 0 if not found.
    [[nodiscard]] std::size_t list_rank(double score, std::string_view member) const;

    // Node at 1-based rank, nullptr when out of range.
    [[nodiscard]] Node* node_by_rank(std::size_t rank) const;

    [[nodiscard]] Node* first_in_range(const ScoreRange& range) const;
    [[nodiscard]] Node* last_in_range(const ScoreRange& range) const;

    std::unique_ptr<Node> head_;
    Node*                 tail_   = nullptr;
    std::size_t           length_ = 0;
    int                   level_  = 1;

    std::unordered_map<std::string, std::unique_ptr<Node>> dict_;
    std::minstd_rand rng_;
};

} // namespace memkv
