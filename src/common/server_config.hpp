#pragma once

#include <cstdint>
#include <string>

#include <boost/program_options.hpp>

namespace memkv {

// ── ServerConfig ──────────────────────────────────────────────────────────────
// Full configuration for one memkv-server process.
// Populated by parse_config() from CLI arguments and an optional config file.
// The core treats every field as read-only after startup.

struct ServerConfig {
    std::string host;                // Bind address for client connections
    uint16_t    port;                // Client port
    uint32_t    max_clients;         // Simultaneous connections accepted
    uint32_t    tick_interval_ms;    // Period of the housekeeping timer
    uint32_t    expire_sample_size;  // Keys sampled per active-expire round
    uint64_t    max_bulk_len;        // Largest accepted bulk argument (bytes)
    uint32_t    max_multibulk_len;   // Largest accepted multi-bulk count
    uint32_t    max_inline_len;      // Longest unterminated line (bytes)
    std::string data_dir;            // Directory holding the snapshot file
    std::string dbfilename;          // Snapshot file name inside data_dir
    bool        load_snapshot;       // Load <data_dir>/<dbfilename> at startup
    bool        save_on_shutdown;    // SAVE before exiting on SIGINT/SIGTERM
    std::string log_level;           // spdlog level string
    std::string config_file;         // Optional INI-style file ("" = none)
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments (and the file named by --config, if any) into a
// ServerConfig.  Command-line values take precedence over file values.
//
// On success: returns a fully validated ServerConfig.
// On error  : throws std::runtime_error with a human-readable message.
//             --help also throws, carrying the help text.
//
// Validates:
//   - port in [1, 65535]
//   - max_clients, tick_interval_ms, expire_sample_size > 0
//   - max_bulk_len, max_multibulk_len > 0, max_inline_len >= 64
//   - dbfilename not empty and without path separators
//   - log_level one of trace|debug|info|warn|error|critical

[[nodiscard]] ServerConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with server options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace memkv
