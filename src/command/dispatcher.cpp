#include "command/dispatcher.hpp"
#include "command/arguments.hpp"

#include "common/errors.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace memkv::command {

Dispatcher::Dispatcher(Keyspace& keyspace, EventSink& events, CommandTable table)
    : keyspace_(keyspace), events_(events), table_(std::move(table)) {
    state_.start_time_ms = keyspace_.clock().now_ms();
    state_.last_save_ms  = state_.start_time_ms;
}

std::optional<Reply> Dispatcher::execute(const std::shared_ptr<Client>& client,
                                         const Request& args) {
    const uint64_t client_id = client ? client->id() : 0;
    if (args.empty()) {
        return std::nullopt;
    }

    ++state_.total_commands;
    std::string name = to_lower(args[0]);
    std::optional<Reply> result;

    try {
        const CommandSpec* spec = table_.find(name);
        if (spec == nullptr) {
            throw unknown_command_error(args[0]);
        }
        if (!spec->arity_ok(args.size())) {
            throw wrong_arity_error(spec->name);
        }
        if (spec->key_index != 0 && spec->required_type) {
            const auto actual = keyspace_.type_of(args[spec->key_index]);
            if (actual && *actual != *spec->required_type) {
                throw wrong_type_error();
            }
        }

        CommandContext ctx{keyspace_, args, client, blocking_, state_, table_};
        result = spec->handler(ctx);

        events_.emit(Event{EventKind::CommandExecuted, client_id, name,
                           result ? std::string{} : std::string{"blocked"}});
    } catch (const CommandError& e) {
        ++state_.failed_commands;
        events_.emit(Event{EventKind::CommandFailed, client_id, name, e.reply_text()});
        result = reply::error(e.reply_text());
    } catch (const std::exception& e) {
        // Resource exhaustion inside a handler fails this command only.
        spdlog::error("Dispatcher: '{}' from client #{} failed: {}", name, client_id, e.what());
        ++state_.failed_commands;
        std::string text = fmt::format("ERR {}", e.what());
        events_.emit(Event{EventKind::CommandFailed, client_id, name, text});
        result = reply::error(std::move(text));
    }

    if (blocking_.has_ready_keys()) {
        blocking_.serve_ready_keys(keyspace_);
    }
    return result;
}

void Dispatcher::client_connected(uint64_t client_id, const std::string& peer) {
    ++state_.connected_clients;
    ++state_.total_connections;
    events_.emit(Event{EventKind::ClientConnected, client_id, {}, peer});
}

void Dispatcher::client_disconnected(uint64_t client_id) {
    blocking_.cancel(client_id);
    if (state_.connected_clients > 0) {
        --state_.connected_clients;
    }
    events_.emit(Event{EventKind::ClientDisconnected, client_id, {}, {}});
}

std::size_t Dispatcher::tick(std::size_t expire_sample_size) {
    const std::size_t evicted = keyspace_.active_expire_cycle(expire_sample_size);
    if (evicted > 0) {
        events_.emit(Event{EventKind::KeysExpired, 0, {}, fmt::format("{}", evicted)});
    }
    handle_blocked_timeouts();
    return evicted;
}

std::size_t Dispatcher::handle_blocked_timeouts() {
    if (blocking_.blocked_count() == 0) {
        return 0;
    }
    return blocking_.expire_timeouts(keyspace_.clock().now_ms());
}

} // namespace memkv::command
