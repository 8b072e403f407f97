#include "common/server_config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>

#include <spdlog/fmt/fmt.h>

namespace po = boost::program_options;

namespace memkv {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

void require_positive(uint64_t value, std::string_view field_name) {
    if (value == 0) {
        throw std::runtime_error(
            fmt::format("{} must be > 0", field_name));
    }
}

bool is_log_level(const std::string& s) {
    return s == "trace" || s == "debug" || s == "info" || s == "warn" ||
           s == "error" || s == "critical";
}

// Validate the fully populated ServerConfig.
void validate(const ServerConfig& cfg) {
    if (cfg.port == 0) {
        throw std::runtime_error("--port must be in [1, 65535], got 0");
    }
    if (cfg.host.empty()) {
        throw std::runtime_error("--host must not be empty");
    }
    require_positive(cfg.max_clients,        "--max-clients");
    require_positive(cfg.tick_interval_ms,   "--tick-interval-ms");
    require_positive(cfg.expire_sample_size, "--expire-sample-size");
    require_positive(cfg.max_bulk_len,       "--max-bulk-len");
    require_positive(cfg.max_multibulk_len,  "--max-multibulk-len");

    if (cfg.max_inline_len < 64) {
        throw std::runtime_error(
            fmt::format("--max-inline-len must be >= 64, got {}", cfg.max_inline_len));
    }
    if (cfg.dbfilename.empty()) {
        throw std::runtime_error("--dbfilename must not be empty");
    }
    if (cfg.dbfilename.find('/') != std::string::npos) {
        throw std::runtime_error(
            fmt::format("--dbfilename must be a plain file name, got '{}'", cfg.dbfilename));
    }
    if (!is_log_level(cfg.log_level)) {
        throw std::runtime_error(
            fmt::format("--log-level must be one of trace|debug|info|warn|error|critical, got '{}'",
                        cfg.log_level));
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("config,c",
            po::value<std::string>()->default_value(""),
            "Read options from an INI-style file (key = value per line)")
        ("host",
            po::value<std::string>()->default_value("0.0.0.0"),
            "Bind address for client connections")
        ("port,p",
            po::value<uint16_t>()->default_value(6379),
            "Port for client connections")
        ("max-clients",
            po::value<uint32_t>()->default_value(10000),
            "Maximum number of simultaneous client connections")
        ("tick-interval-ms",
            po::value<uint32_t>()->default_value(100),
            "Housekeeping timer period (active expire, blocked-client timeouts)")
        ("expire-sample-size",
            po::value<uint32_t>()->default_value(20),
            "Keys with an expiry sampled per active-expire round")
        ("max-bulk-len",
            po::value<uint64_t>()->default_value(512ULL * 1024 * 1024),
            "Largest bulk argument accepted from a client, in bytes")
        ("max-multibulk-len",
            po::value<uint32_t>()->default_value(1024 * 1024),
            "Largest number of arguments in one multi-bulk request")
        ("max-inline-len",
            po::value<uint32_t>()->default_value(64 * 1024),
            "Longest request line accepted without a terminator, in bytes")
        ("dir",
            po::value<std::string>()->default_value("./data"),
            "Directory for the snapshot file")
        ("dbfilename",
            po::value<std::string>()->default_value("dump.mkv"),
            "Snapshot file name")
        ("no-load",
            po::bool_switch()->default_value(false),
            "Do not load the snapshot file at startup")
        ("save-on-shutdown",
            po::bool_switch()->default_value(false),
            "Write a snapshot when the server stops on a signal")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ServerConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("memkv-server options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        // Handle --help before notify() so a bad config file doesn't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        // Values already stored from the command line win over the file.
        const auto config_file = vm["config"].as<std::string>();
        if (!config_file.empty()) {
            std::ifstream in{config_file};
            if (!in) {
                throw std::runtime_error(
                    fmt::format("Cannot open config file '{}'", config_file));
            }
            po::store(po::parse_config_file(in, desc), vm);
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    ServerConfig cfg;
    cfg.host               = vm["host"].as<std::string>();
    cfg.port               = vm["port"].as<uint16_t>();
    cfg.max_clients        = vm["max-clients"].as<uint32_t>();
    cfg.tick_interval_ms   = vm["tick-interval-ms"].as<uint32_t>();
    cfg.expire_sample_size = vm["expire-sample-size"].as<uint32_t>();
    cfg.max_bulk_len       = vm["max-bulk-len"].as<uint64_t>();
    cfg.max_multibulk_len  = vm["max-multibulk-len"].as<uint32_t>();
    cfg.max_inline_len     = vm["max-inline-len"].as<uint32_t>();
    cfg.data_dir           = vm["dir"].as<std::string>();
    cfg.dbfilename         = vm["dbfilename"].as<std::string>();
    cfg.load_snapshot      = !vm["no-load"].as<bool>();
    cfg.save_on_shutdown   = vm["save-on-shutdown"].as<bool>();
    cfg.log_level          = vm["log-level"].as<std::string>();
    cfg.config_file        = vm["config"].as<std::string>();

    validate(cfg);
    return cfg;
}

} // namespace memkv
