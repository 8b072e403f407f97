#pragma once

#include "command/dispatcher.hpp"
#include "common/server_config.hpp"
#include "network/resp_protocol.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace memkv::network {

class Session;

// Owns the io_context, the TCP acceptor and the housekeeping timer.
//
// Usage:
//   Server srv{config, dispatcher};
//   srv.run();   // blocks until SIGINT/SIGTERM or stop()
//
// The io_context runs on the calling thread only: command execution is
// single-threaded, so no component behind the Dispatcher needs locking.
class Server {
public:
    // Binds and listens immediately; throws boost::system::system_error if the
    // address is unavailable.  Port 0 picks an ephemeral port.
    Server(const ServerConfig& config, command::Dispatcher& dispatcher);
    ~Server();

    Server(const Server&)            = delete;
    Server& operator=(const Server&) = delete;

    // Begins accepting connections, starts the tick timer and installs
    // SIGINT / SIGTERM handlers.  Blocks until the server stops.
    void run();

    // Requests a graceful stop: closes the acceptor and every session, then
    // lets run() return.  Safe to call from any thread.
    void stop();

    // Bound port (useful when configured with port 0).
    [[nodiscard]] uint16_t local_port() const;

    [[nodiscard]] std::size_t session_count() const noexcept { return sessions_.size(); }

    [[nodiscard]] boost::asio::io_context& io_context() noexcept { return ioc_; }

private:
    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> tick_loop();

    void reject(boost::asio::ip::tcp::socket& socket);
    void shutdown();

    const ServerConfig&  config_;
    command::Dispatcher& dispatcher_;
    ProtocolLimits       limits_;

    boost::asio::io_context        ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::steady_timer      tick_timer_;
    boost::asio::signal_set        signals_;

    std::unordered_map<uint64_t, std::shared_ptr<Session>> sessions_;
    uint64_t next_client_id_ = 1;
    bool     stopping_ = false;
};

} // namespace memkv::network
