#pragma once

#include "command/client.hpp"
#include "command/server_state.hpp"
#include "network/reply.hpp"
#include "network/resp_protocol.hpp"
#include "storage/keyspace.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace memkv::command {

class BlockingRegistry;
class CommandTable;

using network::Request;

// ── Command flags ─────────────────────────────────────────────────────────────

enum CommandFlags : uint8_t {
    kFlagNone     = 0,
    kFlagWrite    = 1 << 0,
    kFlagReadOnly = 1 << 1,
    kFlagBlocking = 1 << 2,
};

// ── CommandContext ────────────────────────────────────────────────────────────
//
// Everything a handler may touch while it runs.  Lives for one execute().

struct CommandContext {
    Keyspace&                      keyspace;
    const Request&                 args;
    const std::shared_ptr<Client>& client;
    BlockingRegistry&              blocking;
    ServerState&                   server;
    const CommandTable&            table;

    [[nodiscard]] std::size_t argc() const noexcept { return args.size(); }
    [[nodiscard]] const std::string& arg(std::size_t i) const { return args[i]; }
    [[nodiscard]] int64_t now_ms() const { return keyspace.clock().now_ms(); }
};

// Returns the reply, or nullopt when the client has been parked in the
// blocking registry and will be answered later through Client::deliver().
using Handler = std::function<std::optional<Reply>(CommandContext&)>;

// ── CommandSpec ───────────────────────────────────────────────────────────────
//
// Arity counts include the command name: GET is {2, 2}, DEL is {2, -1}.

struct CommandSpec {
    std::string              name;            // lower case
    int                      min_args = 1;
    int                      max_args = -1;   // -1 = unbounded
    std::size_t              key_index = 0;   // 0 = no key argument
    std::optional<ValueType> required_type;   // pre-checked against key_index
    uint8_t                  flags = kFlagNone;
    Handler                  handler;

    [[nodiscard]] bool arity_ok(std::size_t argc) const noexcept {
        const auto n = static_cast<int>(argc);
        return n >= min_args && (max_args < 0 || n <= max_args);
    }
};

// ── CommandTable ──────────────────────────────────────────────────────────────

class CommandTable {
public:
    // Registers `spec`, replacing any command with the same name.
    void add(CommandSpec spec);

    // Case-insensitive lookup.  nullptr if unknown.
    [[nodiscard]] const CommandSpec* find(std::string_view name) const;

    // Registered names, sorted.
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] std::size_t size() const noexcept { return commands_.size(); }

private:
    std::unordered_map<std::string, CommandSpec> commands_;
};

// ── Command families ──────────────────────────────────────────────────────────

void register_server_commands(CommandTable& table);
void register_key_commands(CommandTable& table);
void register_string_commands(CommandTable& table);
void register_list_commands(CommandTable& table);
void register_set_commands(CommandTable& table);
void register_zset_commands(CommandTable& table);

// Table with every family registered.
[[nodiscard]] CommandTable make_default_command_table();

} // namespace memkv::command
