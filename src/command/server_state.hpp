#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace memkv::command {

inline constexpr std::string_view kVersion = "1.0.0";

// ── ServerState ───────────────────────────────────────────────────────────────
//
// Process-wide facts that server commands (INFO, SAVE, LASTSAVE) report or
// act on.  Owned by the Dispatcher; the network layer updates the connection
// counters.

struct ServerState {
    int64_t  start_time_ms = 0;
    uint16_t tcp_port      = 0;

    // Where SAVE writes.  Empty disables SAVE.
    std::filesystem::path snapshot_path;
    int64_t last_save_ms = 0;             // Unix ms; start time until first save
    uint64_t saves       = 0;

    uint64_t connected_clients    = 0;
    uint64_t total_connections    = 0;
    uint64_t rejected_connections = 0;
    uint64_t total_commands       = 0;
    uint64_t failed_commands      = 0;
};

} // namespace memkv::command
