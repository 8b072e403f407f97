#include "command/arguments.hpp"
#include "command/blocking.hpp"
#include "command/command_table.hpp"
#include "persistence/snapshot.hpp"

#include "common/errors.hpp"

#include <spdlog/fmt/fmt.h>

#include <unistd.h>

#include <string>
#include <vector>

namespace memkv::command {

namespace {

// ── INFO ──────────────────────────────────────────────────────────────────────

std::string info_text(CommandContext& ctx, const std::string& section) {
    const bool all = section.empty() || section == "all" || section == "default" ||
                     section == "everything";
    const auto& s = ctx.server;
    const int64_t now = ctx.now_ms();
    std::string out;

    if (all || section == "server") {
        out += "# Server\r\n";
        out += fmt::format("memkv_version:{}\r\n", kVersion);
        out += fmt::format("process_id:{}\r\n", ::getpid());
        out += fmt::format("tcp_port:{}\r\n", s.tcp_port);
        out += fmt::format("uptime_in_seconds:{}\r\n", (now - s.start_time_ms) / 1000);
        out += "\r\n";
    }
    if (all || section == "clients") {
        out += "# Clients\r\n";
        out += fmt::format("connected_clients:{}\r\n", s.connected_clients);
        out += fmt::format("blocked_clients:{}\r\n", ctx.blocking.blocked_count());
        out += "\r\n";
    }
    if (all || section == "persistence") {
        out += "# Persistence\r\n";
        out += fmt::format("snapshot_enabled:{}\r\n", s.snapshot_path.empty() ? 0 : 1);
        out += fmt::format("snapshot_saves:{}\r\n", s.saves);
        out += fmt::format("snapshot_last_save_time:{}\r\n", s.last_save_ms / 1000);
        out += "\r\n";
    }
    if (all || section == "stats") {
        out += "# Stats\r\n";
        out += fmt::format("total_connections_received:{}\r\n", s.total_connections);
        out += fmt::format("rejected_connections:{}\r\n", s.rejected_connections);
        out += fmt::format("total_commands_processed:{}\r\n", s.total_commands);
        out += fmt::format("failed_commands:{}\r\n", s.failed_commands);
        out += fmt::format("expired_keys:{}\r\n", ctx.keyspace.expired_keys());
        out += "\r\n";
    }
    if (all || section == "keyspace") {
        out += "# Keyspace\r\n";
        if (ctx.keyspace.size() > 0) {
            out += fmt::format("db0:keys={},expires={}\r\n",
                               ctx.keyspace.size(), ctx.keyspace.expires_size());
        }
        out += "\r\n";
    }
    return out;
}

std::optional<Reply> cmd_ping(CommandContext& ctx) {
    if (ctx.argc() == 2) {
        return reply::bulk(ctx.arg(1));
    }
    return reply::status("PONG");
}

std::optional<Reply> cmd_echo(CommandContext& ctx) {
    return reply::bulk(ctx.arg(1));
}

std::optional<Reply> cmd_dbsize(CommandContext& ctx) {
    return reply::integer(static_cast<int64_t>(ctx.keyspace.size()));
}

std::optional<Reply> cmd_flushdb(CommandContext& ctx) {
    ctx.keyspace.clear();
    return reply::ok();
}

std::optional<Reply> cmd_info(CommandContext& ctx) {
    const std::string section = ctx.argc() == 2 ? to_lower(ctx.arg(1)) : std::string{};
    return reply::bulk(info_text(ctx, section));
}

std::optional<Reply> cmd_save(CommandContext& ctx) {
    if (ctx.server.snapshot_path.empty()) {
        throw invalid_argument_error("snapshot persistence is disabled");
    }
    if (auto ec = persistence::Snapshot::save(ctx.server.snapshot_path, ctx.keyspace)) {
        throw invalid_argument_error(fmt::format("snapshot failed: {}", ec.message()));
    }
    ctx.server.last_save_ms = ctx.now_ms();
    ++ctx.server.saves;
    return reply::ok();
}

std::optional<Reply> cmd_lastsave(CommandContext& ctx) {
    return reply::integer(ctx.server.last_save_ms / 1000);
}

std::optional<Reply> cmd_command(CommandContext& ctx) {
    const auto names = ctx.table.names();
    if (ctx.argc() == 2) {
        if (iequals(ctx.arg(1), "count")) {
            return reply::integer(static_cast<int64_t>(names.size()));
        }
        throw syntax_error();
    }
    return reply::bulk_array(names);
}

} // anonymous namespace

void register_server_commands(CommandTable& table) {
    table.add({"ping",     1, 2, 0, std::nullopt, kFlagReadOnly, cmd_ping});
    table.add({"echo",     2, 2, 0, std::nullopt, kFlagReadOnly, cmd_echo});
    table.add({"dbsize",   1, 1, 0, std::nullopt, kFlagReadOnly, cmd_dbsize});
    table.add({"flushdb",  1, 1, 0, std::nullopt, kFlagWrite,    cmd_flushdb});
    table.add({"flushall", 1, 1, 0, std::nullopt, kFlagWrite,    cmd_flushdb});
    table.add({"info",     1, 2, 0, std::nullopt, kFlagReadOnly, cmd_info});
    table.add({"save",     1, 1, 0, std::nullopt, kFlagReadOnly, cmd_save});
    table.add({"lastsave", 1, 1, 0, std::nullopt, kFlagReadOnly, cmd_lastsave});

    // The session closes the connection after replying.
    table.add({"quit", 1, -1, 0, std::nullopt, kFlagNone,
               [](CommandContext&) -> std::optional<Reply> { return reply::ok(); }});

    // Stock clients send COMMAND / COMMAND COUNT on connect.
    table.add({"command", 1, 2, 0, std::nullopt, kFlagReadOnly, cmd_command});
}

} // namespace memkv::command
