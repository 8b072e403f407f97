#include "storage/keyspace.hpp"

#include "storage/glob.hpp"
#include "storage/random_pick.hpp"

#include <algorithm>
#include <utility>

namespace memkv {

namespace {

// Upper bound on sampling rounds per active_expire_cycle() call so that a
// timer tick never monopolises the event loop.
constexpr int kMaxExpireRounds = 16;

} // namespace

Keyspace::Keyspace(const Clock& clock)
    : clock_(clock), rng_(std::random_device{}()) {}

// ── Expire table bookkeeping ──────────────────────────────────────────────────

void Keyspace::add_expire_entry(const std::string& key, int64_t when_ms) {
    auto it = expires_.find(key);
    if (it != expires_.end()) {
        it->second.when_ms = when_ms;
        return;
    }
    expires_.emplace(key, ExpireEntry{when_ms, expire_slots_.size()});
    expire_slots_.push_back(key);
}

void Keyspace::remove_expire_entry(const std::string& key) {
    auto it = expires_.find(key);
    if (it == expires_.end()) {
        return;
    }
    const std::size_t slot = it->second.slot;
    expires_.erase(it);

    // Swap-remove from the dense slot vector.
    if (slot != expire_slots_.size() - 1) {
        expire_slots_[slot] = std::move(expire_slots_.back());
        expires_.find(expire_slots_[slot])->second.slot = slot;
    }
    expire_slots_.pop_back();
}

void Keyspace::evict(const std::string& key) {
    remove_expire_entry(key);
    data_.erase(key);
    ++expired_keys_;
}

bool Keyspace::expire_if_needed(const std::string& key) {
    auto it = expires_.find(key);
    if (it == expires_.end() || it->second.when_ms > clock_.now_ms()) {
        return false;
    }
    // `key` may alias the slot string that evict() moves around.
    const std::string doomed = key;
    evict(doomed);
    return true;
}

// ── Generic access ────────────────────────────────────────────────────────────

Value* Keyspace::lookup(const std::string& key) {
    expire_if_needed(key);
    auto it = data_.find(key);
    if (it == data_.end()) {
        return nullptr;
    }
    return &it->second;
}

void Keyspace::set(const std::string& key, Value value) {
    data_.insert_or_assign(key, std::move(value));
    remove_expire_entry(key);
}

void Keyspace::set_keep_ttl(const std::string& key, Value value) {
    expire_if_needed(key);
    data_.insert_or_assign(key, std::move(value));
}

bool Keyspace::del(const std::string& key) {
    if (expire_if_needed(key)) {
        return false;
    }
    if (data_.erase(key) == 0) {
        return false;
    }
    remove_expire_entry(key);
    return true;
}

bool Keyspace::exists(const std::string& key) {
    return lookup(key) != nullptr;
}

std::optional<ValueType> Keyspace::type_of(const std::string& key) {
    const Value* v = lookup(key);
    if (v == nullptr) {
        return std::nullopt;
    }
    return memkv::type_of(*v);
}

bool Keyspace::remove_if_empty(const std::string& key) {
    auto it = data_.find(key);
    if (it == data_.end() || !is_empty_container(it->second)) {
        return false;
    }
    data_.erase(it);
    remove_expire_entry(key);
    return true;
}

// ── Expiration ────────────────────────────────────────────────────────────────

bool Keyspace::set_expire(const std::string& key, int64_t when_ms) {
    if (lookup(key) == nullptr) {
        return false;
    }
    if (when_ms <= clock_.now_ms()) {
        // Deleting because of an explicit past deadline is a deletion, not an
        // expiration, so it is not counted in expired_keys_.
        data_.erase(key);
        remove_expire_entry(key);
        return true;
    }
    add_expire_entry(key, when_ms);
    return true;
}

bool Keyspace::clear_expire(const std::string& key) {
    if (lookup(key) == nullptr || expires_.count(key) == 0) {
        return false;
    }
    remove_expire_entry(key);
    return true;
}

std::optional<int64_t> Keyspace::expire_at(const std::string& key) {
    if (lookup(key) == nullptr) {
        return std::nullopt;
    }
    auto it = expires_.find(key);
    if (it == expires_.end()) {
        return std::nullopt;
    }
    return it->second.when_ms;
}

int64_t Keyspace::ttl_ms(const std::string& key) {
    if (lookup(key) == nullptr) {
        return -2;
    }
    auto it = expires_.find(key);
    if (it == expires_.end()) {
        return -1;
    }
    return std::max<int64_t>(it->second.when_ms - clock_.now_ms(), 0);
}

std::size_t Keyspace::active_expire_cycle(std::size_t sample_size) {
    std::size_t evicted_total = 0;

    for (int round = 0; round < kMaxExpireRounds && !expire_slots_.empty(); ++round) {
        const int64_t now = clock_.now_ms();
        const std::size_t samples = std::min(sample_size, expire_slots_.size());
        std::size_t evicted = 0;

        for (std::size_t i = 0; i < samples && !expire_slots_.empty(); ++i) {
            const std::string key = expire_slots_[rng_() % expire_slots_.size()];
            if (expires_.find(key)->second.when_ms <= now) {
                evict(key);
                ++evicted;
            }
        }

        evicted_total += evicted;

        // Stop once at most 25% of the sample was stale.
        if (evicted * 4 <= samples) {
            break;
        }
    }
    return evicted_total;
}

// ── Keyspace-wide operations ──────────────────────────────────────────────────

bool Keyspace::rename(const std::string& src, const std::string& dst) {
    Value* v = lookup(src);
    if (v == nullptr) {
        return false;
    }
    if (src == dst) {
        return true;
    }

    const auto when = expire_at(src);
    Value moved = std::move(*v);
    data_.erase(src);
    remove_expire_entry(src);

    set(dst, std::move(moved));
    if (when) {
        add_expire_entry(dst, *when);
    }
    return true;
}

std::optional<std::string> Keyspace::random_key() {
    while (!data_.empty()) {
        std::string key = random_element(data_, rng_).first;
        if (!expire_if_needed(key)) {
            return key;
        }
    }
    return std::nullopt;
}

std::vector<std::string> Keyspace::keys(const std::string& pattern) {
    const bool match_all = pattern == "*";
    const int64_t now = clock_.now_ms();

    std::vector<std::string> result;
    std::vector<std::string> stale;
    for (const auto& [key, _] : data_) {
        if (!match_all && !glob_match(pattern, key)) {
            continue;
        }
        auto exp = expires_.find(key);
        if (exp != expires_.end() && exp->second.when_ms <= now) {
            stale.push_back(key);
            continue;
        }
        result.push_back(key);
    }

    for (const auto& key : stale) {
        evict(key);
    }
    return result;
}

void Keyspace::clear() {
    data_.clear();
    expires_.clear();
    expire_slots_.clear();
}

// ── Persistence collaborator ──────────────────────────────────────────────────

void Keyspace::for_each_entry(const EntryVisitor& visit) const {
    const int64_t now = clock_.now_ms();
    for (const auto& [key, value] : data_) {
        std::optional<int64_t> when;
        auto exp = expires_.find(key);
        if (exp != expires_.end()) {
            if (exp->second.when_ms <= now) {
                continue;
            }
            when = exp->second.when_ms;
        }
        visit(key, value, when);
    }
}

bool Keyspace::restore(const std::string& key, Value value,
                       std::optional<int64_t> expire_at_ms) {
    if (expire_at_ms && *expire_at_ms <= clock_.now_ms()) {
        return false;
    }
    set(key, std::move(value));
    if (expire_at_ms) {
        add_expire_entry(key, *expire_at_ms);
    }
    return true;
}

} // namespace memkv
