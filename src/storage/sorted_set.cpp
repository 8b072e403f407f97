#include "storage/sorted_set.hpp"

#include "common/numeric.hpp"

#include <utility>

namespace memkv {

// ── Score bounds ──────────────────────────────────────────────────────────────

bool parse_score_bound(std::string_view text, double& value, bool& exclusive) {
    exclusive = false;
    if (!text.empty() && text.front() == '(') {
        exclusive = true;
        text.remove_prefix(1);
    }
    return parse_double(text, value);
}

// ── Construction ──────────────────────────────────────────────────────────────

SortedSet::SortedSet()
    : head_(std::make_unique<Node>(kMaxLevel, std::string{}, 0)),
      rng_(std::random_device{}()) {}

// A moved-from SortedSet may only be destroyed or assigned to.
SortedSet::SortedSet(SortedSet&& other) noexcept
    : head_(std::move(other.head_)),
      tail_(std::exchange(other.tail_, nullptr)),
      length_(std::exchange(other.length_, 0)),
      level_(std::exchange(other.level_, 1)),
      dict_(std::move(other.dict_)),
      rng_(other.rng_) {}

SortedSet& SortedSet::operator=(SortedSet&& other) noexcept {
    if (this != &other) {
        head_   = std::move(other.head_);
        dict_   = std::move(other.dict_);
        tail_   = std::exchange(other.tail_, nullptr);
        length_ = std::exchange(other.length_, 0);
        level_  = std::exchange(other.level_, 1);
        rng_    = other.rng_;
    }
    return *this;
}

int SortedSet::random_level() {
    int level = 1;
    while (level < kMaxLevel &&
           static_cast<double>(rng_() & 0xFFFF) < kProbability * 0xFFFF) {
        ++level;
    }
    return level;
}

// ── Skip list primitives ──────────────────────────────────────────────────────

void SortedSet::list_link(Node* x) {
    Node*       update[kMaxLevel];
    std::size_t rank[kMaxLevel];

    Node* p = head_.get();
    for (int i = level_ - 1; i >= 0; --i) {
        // Rank crossed to reach the insert position on this level.
        rank[i] = (i == level_ - 1) ? 0 : rank[i + 1];
        while (p->levels[i].forward != nullptr &&
               less(p->levels[i].forward->score, p->levels[i].forward->member,
                    x->score, x->member)) {
            rank[i] += p->levels[i].span;
            p = p->levels[i].forward;
        }
        update[i] = p;
    }

    const int level = static_cast<int>(x->levels.size());
    if (level > level_) {
        for (int i = level_; i < level; ++i) {
            rank[i]   = 0;
            update[i] = head_.get();
            update[i]->levels[i].span = length_;
        }
        level_ = level;
    }

    for (int i = 0; i < level; ++i) {
        x->levels[i].forward         = update[i]->levels[i].forward;
        update[i]->levels[i].forward = x;

        x->levels[i].span         = update[i]->levels[i].span - (rank[0] - rank[i]);
        update[i]->levels[i].span = (rank[0] - rank[i]) + 1;
    }

    // Levels above the new node now skip one more element.
    for (int i = level; i < level_; ++i) {
        update[i]->levels[i].span++;
    }

    x->backward = (update[0] == head_.get()) ? nullptr : update[0];
    if (x->levels[0].forward != nullptr) {
        x->levels[0].forward->backward = x;
    } else {
        tail_ = x;
    }
    ++length_;
}

void SortedSet::list_delete_node(Node* x, Node** update) {
    for (int i = 0; i < level_; ++i) {
        if (update[i]->levels[i].forward == x) {
            update[i]->levels[i].span   += x->levels[i].span - 1;
            update[i]->levels[i].forward = x->levels[i].forward;
        } else {
            update[i]->levels[i].span -= 1;
        }
    }
    if (x->levels[0].forward != nullptr) {
        x->levels[0].forward->backward = x->backward;
    } else {
        tail_ = x->backward;
    }
    while (level_ > 1 && head_->levels[level_ - 1].forward == nullptr) {
        --level_;
    }
    --length_;
}

void SortedSet::list_unlink(Node* x) {
    Node* update[kMaxLevel];

    Node* p = head_.get();
    for (int i = level_ - 1; i >= 0; --i) {
        while (p->levels[i].forward != nullptr && p->levels[i].forward != x &&
               less(p->levels[i].forward->score, p->levels[i].forward->member,
                    x->score, x->member)) {
            p = p->levels[i].forward;
        }
        update[i] = p;
    }
    list_delete_node(x, update);
}

void SortedSet::erase_node(Node* x, Node** update) {
    list_delete_node(x, update);
    dict_.erase(dict_.find(x->member));
}

std::size_t SortedSet::list_rank(double score, std::string_view member) const {
    std::size_t rank = 0;
    const Node* x = head_.get();
    for (int i = level_ - 1; i >= 0; --i) {
        while (x->levels[i].forward != nullptr &&
               (x->levels[i].forward->score < score ||
                (x->levels[i].forward->score == score &&
                 x->levels[i].forward->member <= member))) {
            rank += x->levels[i].span;
            x = x->levels[i].forward;
        }
        if (x != head_.get() && x->member == member) {
            return rank;
        }
    }
    return 0;
}

SortedSet::Node* SortedSet::node_by_rank(std::size_t rank) const {
    std::size_t traversed = 0;
    Node* x = head_.get();
    for (int i = level_ - 1; i >= 0; --i) {
        while (x->levels[i].forward != nullptr && traversed + x->levels[i].span <= rank) {
            traversed += x->levels[i].span;
            x = x->levels[i].forward;
        }
        if (traversed == rank) {
            return x == head_.get() ? nullptr : x;
        }
    }
    return nullptr;
}

SortedSet::Node* SortedSet::first_in_range(const ScoreRange& range) const {
    if (range.empty() || tail_ == nullptr || !range.above_min(tail_->score)) {
        return nullptr;
    }
    Node* x = head_.get();
    for (int i = level_ - 1; i >= 0; --i) {
        while (x->levels[i].forward != nullptr &&
               !range.above_min(x->levels[i].forward->score)) {
            x = x->levels[i].forward;
        }
    }
    x = x->levels[0].forward;
    if (x == nullptr || !range.below_max(x->score)) {
        return nullptr;
    }
    return x;
}

SortedSet::Node* SortedSet::last_in_range(const ScoreRange& range) const {
    const Node* first = head_->levels[0].forward;
    if (range.empty() || first == nullptr || !range.below_max(first->score)) {
        return nullptr;
    }
    Node* x = head_.get();
    for (int i = level_ - 1; i >= 0; --i) {
        while (x->levels[i].forward != nullptr &&
               range.below_max(x->levels[i].forward->score)) {
            x = x->levels[i].forward;
        }
    }
    if (x == head_.get() || !range.above_min(x->score)) {
        return nullptr;
    }
    return x;
}

// ── Public operations ─────────────────────────────────────────────────────────

bool SortedSet::insert_or_update(const std::string& member, double score) {
    auto it = dict_.find(member);
    if (it == dict_.end()) {
        auto pos = dict_.emplace(member, std::make_unique<Node>(random_level(), member, score)).first;
        list_link(pos->second.get());
        return true;
    }
    Node* x = it->second.get();
    if (x->score != score) {
        // Re-score: unlink at the old position, relink at the new one.
        list_unlink(x);
        x->score = score;
        list_link(x);
    }
    return false;
}

bool SortedSet::remove(const std::string& member) {
    auto it = dict_.find(member);
    if (it == dict_.end()) {
        return false;
    }
    list_unlink(it->second.get());
    dict_.erase(it);
    return true;
}

std::optional<double> SortedSet::score_of(const std::string& member) const {
    auto it = dict_.find(member);
    if (it == dict_.end()) {
        return std::nullopt;
    }
    return it->second->score;
}

std::optional<std::size_t> SortedSet::rank_of(const std::string& member, bool reverse) const {
    auto it = dict_.find(member);
    if (it == dict_.end()) {
        return std::nullopt;
    }
    const std::size_t rank = list_rank(it->second->score, member);
    if (rank == 0) {
        return std::nullopt;
    }
    return reverse ? length_ - rank : rank - 1;
}

double SortedSet::increment_score(const std::string& member, double delta) {
    const double updated = score_of(member).value_or(0.0) + delta;
    insert_or_update(member, updated);
    return updated;
}

std::vector<ScoredMember> SortedSet::range_by_rank(std::size_t start, std::size_t stop,
                                                   bool reverse) const {
    std::vector<ScoredMember> out;
    if (start > stop || start >= length_) {
        return out;
    }
    if (stop >= length_) {
        stop = length_ - 1;
    }

    out.reserve(stop - start + 1);
    const Node* x = reverse ? node_by_rank(length_ - start) : node_by_rank(start + 1);
    for (std::size_t n = stop - start + 1; x != nullptr && n > 0; --n) {
        out.push_back({x->member, x->score});
        x = reverse ? x->backward : x->levels[0].forward;
    }
    return out;
}

std::vector<ScoredMember> SortedSet::range_by_score(const ScoreRange& range, bool reverse,
                                                    std::size_t offset, int64_t limit) const {
    std::vector<ScoredMember> out;
    const Node* x = reverse ? last_in_range(range) : first_in_range(range);

    while (x != nullptr && offset > 0) {
        --offset;
        x = reverse ? x->backward : x->levels[0].forward;
    }

    while (x != nullptr && limit != 0) {
        const bool inside = reverse ? range.above_min(x->score) : range.below_max(x->score);
        if (!inside) {
            break;
        }
        out.push_back({x->member, x->score});
        x = reverse ? x->backward : x->levels[0].forward;
        if (limit > 0) {
            --limit;
        }
    }
    return out;
}

std::size_t SortedSet::count_in_range(const ScoreRange& range) const {
    const Node* first = first_in_range(range);
    if (first == nullptr) {
        return 0;
    }
    const Node* last = last_in_range(range);
    const std::size_t first_rank = list_rank(first->score, first->member);
    const std::size_t last_rank  = list_rank(last->score, last->member);
    return last_rank - first_rank + 1;
}

std::size_t SortedSet::remove_range_by_rank(std::size_t start, std::size_t stop) {
    if (start > stop || start >= length_) {
        return 0;
    }

    Node* update[kMaxLevel];
    std::size_t traversed = 0;

    // Ranks are 1-based inside the skip list.
    const std::size_t first = start + 1;
    const std::size_t last  = stop + 1;

    Node* x = head_.get();
    for (int i = level_ - 1; i >= 0; --i) {
        while (x->levels[i].forward != nullptr && traversed + x->levels[i].span < first) {
            traversed += x->levels[i].span;
            x = x->levels[i].forward;
        }
        update[i] = x;
    }

    ++traversed;
    x = x->levels[0].forward;
    std::size_t removed = 0;
    while (x != nullptr && traversed <= last) {
        Node* next = x->levels[0].forward;
        erase_node(x, update);
        ++removed;
        ++traversed;
        x = next;
    }
    return removed;
}

std::size_t SortedSet::remove_range_by_score(const ScoreRange& range) {
    if (range.empty()) {
        return 0;
    }

    Node* update[kMaxLevel];
    Node* x = head_.get();
    for (int i = level_ - 1; i >= 0; --i) {
        while (x->levels[i].forward != nullptr &&
               !range.above_min(x->levels[i].forward->score)) {
            x = x->levels[i].forward;
        }
        update[i] = x;
    }

    x = x->levels[0].forward;
    std::size_t removed = 0;
    while (x != nullptr && range.below_max(x->score)) {
        Node* next = x->levels[0].forward;
        erase_node(x, update);
        ++removed;
        x = next;
    }
    return removed;
}

} // namespace memkv
