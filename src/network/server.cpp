#include "network/server.hpp"
#include "network/session.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <string_view>
#include <vector>

namespace memkv::network {

namespace {

constexpr std::string_view kMaxClientsReply = "-ERR max number of clients reached\r\n";

} // anonymous namespace

Server::Server(const ServerConfig& config, command::Dispatcher& dispatcher)
    : config_(config),
      dispatcher_(dispatcher),
      limits_{config.max_bulk_len, config.max_multibulk_len, config.max_inline_len},
      ioc_(1),
      acceptor_(ioc_),
      tick_timer_(ioc_),
      signals_(ioc_) {
    const auto address = boost::asio::ip::make_address(config_.host);
    const boost::asio::ip::tcp::endpoint endpoint{address, config_.port};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();

    dispatcher_.state().tcp_port = local_port();
    spdlog::info("Server listening on {}:{}", config_.host, local_port());
}

Server::~Server() = default;

uint16_t Server::local_port() const {
    boost::system::error_code ec;
    const auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void Server::run() {
    // Install SIGINT / SIGTERM handler for graceful shutdown.
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            spdlog::info("Server: received signal {}, shutting down", signo);
            shutdown();
        }
    });

    boost::asio::co_spawn(ioc_, accept_loop(), boost::asio::detached);
    boost::asio::co_spawn(ioc_, tick_loop(), boost::asio::detached);

    ioc_.run();

    spdlog::info("Server: io_context stopped");
}

void Server::stop() {
    boost::asio::post(ioc_, [this] { shutdown(); });
}

void Server::shutdown() {
    if (stopping_) {
        return;
    }
    stopping_ = true;

    boost::system::error_code ec;
    acceptor_.close(ec);
    tick_timer_.cancel();
    signals_.cancel(ec);

    // close() calls back into sessions_.erase(); iterate over a copy.
    std::vector<std::shared_ptr<Session>> open;
    open.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        open.push_back(session);
    }
    for (const auto& session : open) {
        session->close();
    }
}

// ── Accept loop ───────────────────────────────────────────────────────────────

void Server::reject(boost::asio::ip::tcp::socket& socket) {
    ++dispatcher_.state().rejected_connections;

    boost::system::error_code ec;
    boost::asio::write(socket, boost::asio::buffer(kMaxClientsReply.data(), kMaxClientsReply.size()), ec);
    if (ec) {
        spdlog::debug("Server: rejecting client: {}", ec.message());
    }
    socket.close(ec);
}

boost::asio::awaitable<void> Server::accept_loop() {
    spdlog::debug("Server: accept loop started");

    for (;;) {
        boost::system::error_code ec;
        auto socket = co_await acceptor_.async_accept(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                spdlog::warn("Server: accept error: {}", ec.message());
            }
            break;  // Acceptor was closed – time to stop.
        }
        if (stopping_) {
            break;
        }

        if (sessions_.size() >= config_.max_clients) {
            spdlog::warn("Server: max clients ({}) reached, rejecting connection",
                         config_.max_clients);
            reject(socket);
            continue;
        }

        // Disable Nagle – send responses immediately.
        socket.set_option(boost::asio::ip::tcp::no_delay(true), ec);

        const uint64_t id = next_client_id_++;
        auto session = std::make_shared<Session>(
            std::move(socket), id, dispatcher_, limits_,
            [this](uint64_t closed_id) { sessions_.erase(closed_id); });
        sessions_.emplace(id, session);
        session->start();
    }

    spdlog::debug("Server: accept loop exited");
}

// ── Housekeeping ──────────────────────────────────────────────────────────────

boost::asio::awaitable<void> Server::tick_loop() {
    const auto interval = std::chrono::milliseconds(config_.tick_interval_ms);

    while (!stopping_) {
        tick_timer_.expires_after(interval);
        boost::system::error_code ec;
        co_await tick_timer_.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (stopping_) {
            break;
        }
        dispatcher_.tick(config_.expire_sample_size);
    }
}

} // namespace memkv::network
