#pragma once

#include "command/client.hpp"
#include "storage/keyspace.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace memkv::command {

enum class ListEnd : uint8_t { Head, Tail };

// ── BlockingRegistry ──────────────────────────────────────────────────────────
//
// Clients parked by BLPOP / BRPOP.  Each waiter is an explicit record
// (client, keys, deadline, end, arrival order); nothing is suspended.
//
// Fairness: each key keeps a FIFO of the clients waiting on it, so the
// earliest registered waiter is served first.  A client waits on at most one
// command at a time and is removed from every key's queue once served,
// timed out or cancelled.
//
// Keys become "ready" when a push lands on a key somebody waits for.  The
// dispatcher calls serve_ready_keys() after every command, so a push and
// the pops it unblocks appear atomic to other clients.

class BlockingRegistry {
public:
    // Parks `client` on `keys`.  `deadline_ms` is absolute Unix ms, 0 for no
    // deadline.
    void block(const std::shared_ptr<Client>& client, std::vector<std::string> keys,
               int64_t deadline_ms, ListEnd end);

    [[nodiscard]] bool is_blocked(uint64_t client_id) const;

    // Drops the client's waiter, if any (connection closed).
    void cancel(uint64_t client_id);

    // Marks `key` ready if anybody waits on it.
    void signal_key_ready(const std::string& key);

    [[nodiscard]] bool has_ready_keys() const noexcept { return !ready_keys_.empty(); }

    // Pops from every ready key for its earliest waiters until either the
    // list or its waiters run out.  Returns the number of clients served.
    std::size_t serve_ready_keys(Keyspace& keyspace);

    // Answers every waiter whose deadline is <= `now_ms` with a nil array.
    // Returns the number of clients timed out.
    std::size_t expire_timeouts(int64_t now_ms);

    [[nodiscard]] std::size_t blocked_count() const noexcept { return waiters_.size(); }

private:
    struct Waiter {
        std::weak_ptr<Client>    client;
        std::vector<std::string> keys;
        int64_t                  deadline_ms = 0;
        ListEnd                  end = ListEnd::Head;
        uint64_t                 seq = 0;
    };

    // Removes `client_id` from the queues of all its keys and from waiters_.
    void remove_waiter(uint64_t client_id);

    std::unordered_map<uint64_t, Waiter>                     waiters_;
    std::unordered_map<std::string, std::deque<uint64_t>>    queues_;
    std::vector<std::string>                                 ready_keys_;
    std::unordered_set<std::string>                          ready_set_;
    uint64_t                                                 next_seq_ = 0;
};

} // namespace memkv::command
