#include "command/blocking.hpp"

#include <algorithm>
#include <utility>

namespace memkv::command {

void BlockingRegistry::block(const std::shared_ptr<Client>& client,
                             std::vector<std::string> keys, int64_t deadline_ms,
                             ListEnd end) {
    const uint64_t id = client->id();
    remove_waiter(id);

    // A key named twice in one BLPOP is queued once.
    std::vector<std::string> unique;
    for (auto& key : keys) {
        if (std::find(unique.begin(), unique.end(), key) == unique.end()) {
            unique.push_back(std::move(key));
        }
    }
    for (const auto& key : unique) {
        queues_[key].push_back(id);
    }
    waiters_.insert_or_assign(id, Waiter{client, std::move(unique), deadline_ms, end, next_seq_++});
}

bool BlockingRegistry::is_blocked(uint64_t client_id) const {
    return waiters_.count(client_id) != 0;
}

void BlockingRegistry::cancel(uint64_t client_id) {
    remove_waiter(client_id);
}

void BlockingRegistry::remove_waiter(uint64_t client_id) {
    auto it = waiters_.find(client_id);
    if (it == waiters_.end()) {
        return;
    }
    for (const auto& key : it->second.keys) {
        auto q = queues_.find(key);
        if (q == queues_.end()) {
            continue;
        }
        auto& ids = q->second;
        ids.erase(std::remove(ids.begin(), ids.end(), client_id), ids.end());
        if (ids.empty()) {
            queues_.erase(q);
        }
    }
    waiters_.erase(it);
}

void BlockingRegistry::signal_key_ready(const std::string& key) {
    if (queues_.count(key) == 0) {
        return;
    }
    if (ready_set_.insert(key).second) {
        ready_keys_.push_back(key);
    }
}

std::size_t BlockingRegistry::serve_ready_keys(Keyspace& keyspace) {
    std::size_t served = 0;

    while (!ready_keys_.empty()) {
        std::vector<std::string> batch;
        batch.swap(ready_keys_);
        ready_set_.clear();

        for (const auto& key : batch) {
            for (;;) {
                auto q = queues_.find(key);
                if (q == queues_.end() || q->second.empty()) {
                    break;
                }
                Value* value = keyspace.lookup(key);
                auto* list = value != nullptr ? std::get_if<ListValue>(value) : nullptr;
                if (list == nullptr || list->empty()) {
                    break;
                }

                const uint64_t id = q->second.front();
                auto w = waiters_.find(id);
                std::shared_ptr<Client> client = w->second.client.lock();
                const ListEnd end = w->second.end;
                remove_waiter(id);
                if (!client) {
                    continue;   // connection already gone
                }

                std::string element;
                if (end == ListEnd::Head) {
                    element = std::move(list->front());
                    list->pop_front();
                } else {
                    element = std::move(list->back());
                    list->pop_back();
                }
                keyspace.remove_if_empty(key);

                client->deliver(reply::array({reply::bulk(key), reply::bulk(std::move(element))}));
                ++served;
            }
        }
    }
    return served;
}

std::size_t BlockingRegistry::expire_timeouts(int64_t now_ms) {
    std::vector<std::pair<uint64_t, uint64_t>> due;   // (seq, client id)
    for (const auto& [id, waiter] : waiters_) {
        if (waiter.deadline_ms != 0 && waiter.deadline_ms <= now_ms) {
            due.emplace_back(waiter.seq, id);
        }
    }
    std::sort(due.begin(), due.end());

    for (const auto& [seq, id] : due) {
        std::shared_ptr<Client> client = waiters_.at(id).client.lock();
        remove_waiter(id);
        if (client) {
            client->deliver(reply::nil_array());
        }
    }
    return due.size();
}

} // namespace memkv::command
