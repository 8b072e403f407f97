#include "command/dispatcher.hpp"
#include "common/clock.hpp"
#include "common/event_sink.hpp"
#include "common/logger.hpp"
#include "common/server_config.hpp"
#include "network/server.hpp"
#include "persistence/snapshot.hpp"
#include "storage/keyspace.hpp"

#include <boost/system/system_error.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <string>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    memkv::ServerConfig cfg;
    try {
        cfg = memkv::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    const auto level = memkv::parse_log_level(cfg.log_level);
    memkv::init_default_logger(level);
    auto logger = memkv::make_component_logger("server", level);

    logger->info("memkv-server starting – {}:{} max_clients={} tick={}ms",
                 cfg.host, cfg.port, cfg.max_clients, cfg.tick_interval_ms);

    // ── Data directory ───────────────────────────────────────────────────────
    namespace fs = std::filesystem;
    const fs::path data_dir{cfg.data_dir};
    std::error_code fs_ec;
    fs::create_directories(data_dir, fs_ec);
    if (fs_ec) {
        logger->error("Failed to create data directory {}: {}",
                      data_dir.string(), fs_ec.message());
        return 1;
    }
    const fs::path snapshot_path = data_dir / cfg.dbfilename;

    // ── Keyspace ─────────────────────────────────────────────────────────────
    memkv::SystemClock clock;
    memkv::Keyspace keyspace{clock};

    if (cfg.load_snapshot && memkv::persistence::Snapshot::exists(snapshot_path)) {
        memkv::persistence::SnapshotLoadResult loaded;
        if (auto ec = memkv::persistence::Snapshot::load(snapshot_path, keyspace, loaded)) {
            logger->error("Failed to load snapshot {}: {}", snapshot_path.string(), ec.message());
            return 1;
        }
        logger->info("Snapshot loaded: {} keys ({} already expired)",
                     loaded.entries_loaded, loaded.entries_read - loaded.entries_loaded);
    } else {
        logger->info("Starting with an empty keyspace");
    }

    // ── Dispatcher ───────────────────────────────────────────────────────────
    memkv::LogEventSink events{memkv::make_component_logger("events", level)};
    memkv::command::Dispatcher dispatcher{keyspace, events};
    dispatcher.state().snapshot_path = snapshot_path;

    // ── Serve ────────────────────────────────────────────────────────────────
    try {
        memkv::network::Server server{cfg, dispatcher};
        server.run();
    } catch (const boost::system::system_error& e) {
        logger->error("Server error: {}", e.what());
        return 1;
    }

    if (cfg.save_on_shutdown) {
        if (auto ec = memkv::persistence::Snapshot::save(snapshot_path, keyspace)) {
            logger->error("Failed to save snapshot on shutdown: {}", ec.message());
            return 1;
        }
    }

    logger->info("memkv-server stopped");
    return 0;
}
