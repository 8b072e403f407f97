// Throughput benchmark for memkv-server.
//
// Spins up a memkv::network::Server in a background thread on an ephemeral
// port, then measures:
//   (1) SET + GET round trips, one request in flight (latency);
//   (2) pipelined SET batches (throughput);
//   (3) ZADD + ZRANK round trips on a growing sorted set.
//
// Prints: total ops, elapsed time, ops/sec, and latency percentiles (p50,
// p90, p99, p999) for each run.

#include "command/dispatcher.hpp"
#include "common/clock.hpp"
#include "common/event_sink.hpp"
#include "common/server_config.hpp"
#include "network/reply.hpp"
#include "network/resp_protocol.hpp"
#include "network/server.hpp"
#include "storage/keyspace.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

namespace {

using tcp    = boost::asio::ip::tcp;
using io_ctx = boost::asio::io_context;
using clock  = std::chrono::high_resolution_clock;
using ns     = std::chrono::nanoseconds;

constexpr const char* kHost = "127.0.0.1";

// ── RESP client ──────────────────────────────────────────────────────────────

class RespClient {
public:
    explicit RespClient(std::uint16_t port) : ioc_(1), socket_(ioc_) {
        tcp::resolver resolver{ioc_};
        auto endpoints = resolver.resolve(kHost, std::to_string(port));
        boost::asio::connect(socket_, endpoints);
        socket_.set_option(tcp::no_delay(true));
    }

    void send(const std::vector<std::string>& args) {
        const std::string wire = memkv::network::encode_request(args);
        boost::asio::write(socket_, boost::asio::buffer(wire));
    }

    void send_raw(const std::string& wire) {
        boost::asio::write(socket_, boost::asio::buffer(wire));
    }

    memkv::Reply recv() {
        for (;;) {
            if (auto reply = parser_.next()) {
                return std::move(*reply);
            }
            const std::size_t n = socket_.read_some(boost::asio::buffer(chunk_));
            parser_.feed({chunk_.data(), n});
        }
    }

    memkv::Reply cmd(const std::vector<std::string>& args) {
        send(args);
        return recv();
    }

private:
    io_ctx                            ioc_;
    tcp::socket                       socket_;
    memkv::network::ReplyParser       parser_;
    std::array<char, 64 * 1024>       chunk_{};
};

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
};

// `latencies_ns` holds one sample per measured unit; `ops_per_sample` is the
// number of commands each sample covers (pipeline depth).
BenchResult compute_stats(std::vector<int64_t>& latencies_ns, std::size_t ops_per_sample = 1) {
    BenchResult r;
    r.total_ops = latencies_ns.size() * ops_per_sample;

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = static_cast<double>(r.total_ops) / r.elapsed_sec;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(latencies_ns.size()) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);

    return r;
}

void print_result(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.1f µs\n"
        "  p50:          %.1f µs\n"
        "  p90:          %.1f µs\n"
        "  p99:          %.1f µs\n"
        "  p99.9:        %.1f µs\n",
        label, r.total_ops, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

template <typename Fn>
int64_t timed(Fn&& fn) {
    auto t0 = clock::now();
    fn();
    auto t1 = clock::now();
    return std::chrono::duration_cast<ns>(t1 - t0).count();
}

// ── Benchmark runners ────────────────────────────────────────────────────────

BenchResult bench_set_get(std::uint16_t port, std::size_t num_cycles) {
    RespClient client{port};
    std::vector<int64_t> latencies;
    latencies.reserve(num_cycles * 2); // SET + GET per cycle

    for (std::size_t i = 0; i < num_cycles; ++i) {
        std::string key = "key" + std::to_string(i);
        std::string val = "val" + std::to_string(i);

        latencies.push_back(timed([&] { client.cmd({"SET", key, val}); }));
        latencies.push_back(timed([&] { client.cmd({"GET", key}); }));
    }

    return compute_stats(latencies);
}

BenchResult bench_pipelined_set(std::uint16_t port, std::size_t num_cycles, std::size_t depth) {
    RespClient client{port};
    std::vector<int64_t> latencies;
    latencies.reserve(num_cycles / depth + 1);

    for (std::size_t done = 0; done < num_cycles; done += depth) {
        std::string batch;
        for (std::size_t j = 0; j < depth; ++j) {
            batch += memkv::network::encode_request(
                {"SET", "pkey" + std::to_string(done + j), "x"});
        }
        latencies.push_back(timed([&] {
            client.send_raw(batch);
            for (std::size_t j = 0; j < depth; ++j) {
                client.recv();
            }
        }));
    }

    return compute_stats(latencies, depth);
}

BenchResult bench_zset(std::uint16_t port, std::size_t num_cycles) {
    RespClient client{port};
    std::vector<int64_t> latencies;
    latencies.reserve(num_cycles * 2);

    for (std::size_t i = 0; i < num_cycles; ++i) {
        std::string member = "m" + std::to_string(i);
        std::string score  = std::to_string((i * 7919) % 100'000);

        latencies.push_back(timed([&] { client.cmd({"ZADD", "bench:zset", score, member}); }));
        latencies.push_back(timed([&] { client.cmd({"ZRANK", "bench:zset", member}); }));
    }

    return compute_stats(latencies);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // Suppress server logs during benchmark.
    spdlog::set_level(spdlog::level::warn);

    std::size_t num_cycles = 10'000;
    if (argc > 1) {
        num_cycles = static_cast<std::size_t>(std::atol(argv[1]));
        if (num_cycles == 0) num_cycles = 10'000;
    }
    constexpr std::size_t kPipelineDepth = 32;

    // Start server.
    memkv::ServerConfig cfg;
    cfg.host               = kHost;
    cfg.port               = 0;
    cfg.max_clients        = 64;
    cfg.tick_interval_ms   = 100;
    cfg.expire_sample_size = 20;
    cfg.max_bulk_len       = 512ULL * 1024 * 1024;
    cfg.max_multibulk_len  = 1024 * 1024;
    cfg.max_inline_len     = 64 * 1024;
    cfg.load_snapshot      = false;
    cfg.save_on_shutdown   = false;

    memkv::SystemClock system_clock;
    memkv::Keyspace keyspace{system_clock};
    memkv::NullEventSink events;
    memkv::command::Dispatcher dispatcher{keyspace, events};

    memkv::network::Server server{cfg, dispatcher};
    const std::uint16_t port = server.local_port();
    std::thread server_thread{[&] { server.run(); }};

    fprintf(stdout,
        "memkv Benchmark\n"
        "===============\n"
        "Cycles:   %zu\n"
        "Server:   %s:%u\n",
        num_cycles, kHost, port);

    // Warm up (small batch to prime TCP paths / allocator).
    {
        RespClient warm{port};
        for (int i = 0; i < 100; ++i) {
            warm.cmd({"SET", "warmup" + std::to_string(i), "x"});
        }
    }

    auto set_get   = bench_set_get(port, num_cycles);
    auto pipelined = bench_pipelined_set(port, num_cycles, kPipelineDepth);
    auto zset      = bench_zset(port, num_cycles);

    print_result("SET + GET (1 in flight)", set_get);
    print_result("SET pipelined (32 per batch, latency per batch)", pipelined);
    print_result("ZADD + ZRANK (1 in flight)", zset);

    fprintf(stdout, "\n");

    server.stop();
    if (server_thread.joinable()) {
        server_thread.join();
    }

    return 0;
}
