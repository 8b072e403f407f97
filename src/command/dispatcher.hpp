#pragma once

#include "command/blocking.hpp"
#include "command/client.hpp"
#include "command/command_table.hpp"
#include "command/server_state.hpp"
#include "common/event_sink.hpp"
#include "network/reply.hpp"
#include "storage/keyspace.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace memkv::command {

// ── Dispatcher ────────────────────────────────────────────────────────────────
//
// Single entry point from the network layer into the data model.  Looks up
// the command, validates arity and the key's type, runs the handler to
// completion, converts CommandError into an error reply and serves blocked
// clients whose keys became ready.
//
// Not thread-safe: everything runs on the event loop thread.

class Dispatcher {
public:
    Dispatcher(Keyspace& keyspace, EventSink& events,
               CommandTable table = make_default_command_table());

    // Executes one request.  nullopt means the client is now blocked and will
    // be answered through Client::deliver().
    [[nodiscard]] std::optional<Reply> execute(const std::shared_ptr<Client>& client,
                                               const Request& args);

    void client_connected(uint64_t client_id, const std::string& peer);
    void client_disconnected(uint64_t client_id);

    // Periodic housekeeping: one active expiration cycle plus blocked-client
    // deadlines.  Returns the number of keys evicted.
    std::size_t tick(std::size_t expire_sample_size);

    // Times out blocked clients whose deadline has passed.
    std::size_t handle_blocked_timeouts();

    [[nodiscard]] Keyspace& keyspace() noexcept { return keyspace_; }
    [[nodiscard]] BlockingRegistry& blocking() noexcept { return blocking_; }
    [[nodiscard]] ServerState& state() noexcept { return state_; }
    [[nodiscard]] const CommandTable& table() const noexcept { return table_; }

private:
    Keyspace&        keyspace_;
    EventSink&       events_;
    CommandTable     table_;
    BlockingRegistry blocking_;
    ServerState      state_;
};

} // namespace memkv::command
