#pragma once

#include "common/clock.hpp"
#include "common/errors.hpp"
#include "storage/value.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace memkv {

// ── Keyspace ──────────────────────────────────────────────────────────────────
//
// The database: key → Value plus a parallel key → absolute expire time
// (Unix ms).  Every key in the expire table exists in the data table.
//
// Expiration is lazy (every access to a key checks its deadline first and
// removes it if passed) and active (active_expire_cycle() samples the expire
// table from the event loop's timer).  Lazy expiration alone is enough for
// correctness; the active cycle only reclaims memory for keys nobody reads.
//
// Not thread-safe: owned and driven by the single execution thread.  Value
// pointers handed out stay valid until the key is deleted or overwritten,
// which in practice means "for the duration of one command".

class Keyspace {
public:
    // Visitor used by the persistence collaborator.
    using EntryVisitor = std::function<void(const std::string& key, const Value& value,
                                            std::optional<int64_t> expire_at_ms)>;

    explicit Keyspace(const Clock& clock);

    Keyspace(const Keyspace&)            = delete;
    Keyspace& operator=(const Keyspace&) = delete;

    // ── Generic access ────────────────────────────────────────────────────────

    // Returns the value for `key`, or nullptr if absent or expired.
    [[nodiscard]] Value* lookup(const std::string& key);

    // Stores `value`, replacing any previous value and clearing its expiry.
    void set(const std::string& key, Value value);

    // Stores `value`, replacing any previous value but keeping its expiry.
    void set_keep_ttl(const std::string& key, Value value);

    // Removes `key` and its expiry.  Returns true if the key existed.
    bool del(const std::string& key);

    [[nodiscard]] bool exists(const std::string& key);

    [[nodiscard]] std::optional<ValueType> type_of(const std::string& key);

    // ── Typed access ──────────────────────────────────────────────────────────

    // Returns the value as T, nullptr when absent.  Throws a WRONGTYPE
    // CommandError when the key holds another type.
    template <typename T>
    [[nodiscard]] T* find_as(const std::string& key) {
        Value* v = lookup(key);
        if (v == nullptr) {
            return nullptr;
        }
        T* typed = std::get_if<T>(v);
        if (typed == nullptr) {
            throw wrong_type_error();
        }
        return typed;
    }

    // Like find_as(), but creates an empty T when the key is absent.  Used by
    // additive commands (push, add).
    template <typename T>
    T& find_or_create_as(const std::string& key) {
        if (T* existing = find_as<T>(key)) {
            return *existing;
        }
        auto [it, inserted] = data_.insert_or_assign(key, Value{std::in_place_type<T>});
        return std::get<T>(it->second);
    }

    // Deletes `key` if it holds an empty list / set / sorted set.
    // Returns true if the key was removed.
    bool remove_if_empty(const std::string& key);

    // ── Expiration ────────────────────────────────────────────────────────────

    // Sets the absolute expire time of an existing key.  A deadline that has
    // already passed deletes the key.  Returns false if the key is absent.
    bool set_expire(const std::string& key, int64_t when_ms);

    // Removes the expiry of `key`.  Returns true if there was one.
    bool clear_expire(const std::string& key);

    [[nodiscard]] std::optional<int64_t> expire_at(const std::string& key);

    // Remaining time to live in ms; -2 if the key is absent, -1 if it has no
    // expiry.
    [[nodiscard]] int64_t ttl_ms(const std::string& key);

    // One active-expiration round: samples up to `sample_size` keys with an
    // expiry, evicts the expired ones, and repeats while more than a quarter
    // of the sample was expired.  Returns the number of keys evicted.
    std::size_t active_expire_cycle(std::size_t sample_size);

    // ── Keyspace-wide operations ──────────────────────────────────────────────

    // Moves `src` (value and expiry) to `dst`, overwriting `dst`.
    // Returns false if `src` is absent.
    bool rename(const std::string& src, const std::string& dst);

    [[nodiscard]] std::optional<std::string> random_key();

    // Keys matching a glob-style pattern (*, ?, [...], \x).
    [[nodiscard]] std::vector<std::string> keys(const std::string& pattern);

    // Number of stored keys, including expired keys not yet reclaimed.
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] std::size_t expires_size() const noexcept { return expires_.size(); }

    void clear();

    // ── Persistence collaborator ──────────────────────────────────────────────

    // Visits every live entry (expired-but-unreclaimed keys are skipped).
    void for_each_entry(const EntryVisitor& visit) const;

    // Inserts an entry loaded from a snapshot.  Entries whose expiry has
    // already passed are dropped.  Returns true if the entry was stored.
    bool restore(const std::string& key, Value value, std::optional<int64_t> expire_at_ms);

    // ── Introspection ─────────────────────────────────────────────────────────

    [[nodiscard]] uint64_t expired_keys() const noexcept { return expired_keys_; }
    [[nodiscard]] const Clock& clock() const noexcept { return clock_; }

private:
    struct ExpireEntry {
        int64_t     when_ms;
        std::size_t slot;      // index into expire_slots_
    };

    // Deletes `key` if its deadline has passed.  Returns true if it did.
    bool expire_if_needed(const std::string& key);

    void add_expire_entry(const std::string& key, int64_t when_ms);
    void remove_expire_entry(const std::string& key);
    void evict(const std::string& key);

    const Clock& clock_;

    std::unordered_map<std::string, Value>       data_;
    std::unordered_map<std::string, ExpireEntry> expires_;

    // Dense copy of the expire table's keys so the active cycle can sample
    // uniformly in O(1).
    std::vector<std::string> expire_slots_;

    std::minstd_rand rng_;
    uint64_t         expired_keys_ = 0;
};

} // namespace memkv
