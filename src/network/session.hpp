#pragma once

#include "command/client.hpp"
#include "command/dispatcher.hpp"
#include "network/reply.hpp"
#include "network/resp_protocol.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace memkv::network {

// Handles one TCP connection for its lifetime.
//
// Two coroutines share the session:
//   reader  reads bytes, feeds the RequestParser, queues complete requests
//           and executes them in order through the Dispatcher;
//   writer  flushes the output buffer whenever something was appended.
//
// A request that blocks (BLPOP/BRPOP) stops execution of the queue; later
// pipelined requests wait until deliver() answers the blocked one.  Replies
// therefore always leave in request order.  Once enough requests are held
// behind a blocked command the reader stops reading until it is resumed.
//
// Everything runs on the Server's single io_context thread.
class Session : public command::Client,
                public std::enable_shared_from_this<Session> {
public:
    using CloseHandler = std::function<void(uint64_t client_id)>;

    Session(boost::asio::ip::tcp::socket socket, uint64_t id,
            command::Dispatcher& dispatcher, ProtocolLimits limits,
            CloseHandler on_close);

    // Spawns the reader and writer coroutines.
    void start();

    // Closes the socket and cancels any blocking wait.  Idempotent.
    void close();

    [[nodiscard]] uint64_t id() const noexcept override { return id_; }

    // Completes a blocked command and resumes queued requests.
    void deliver(Reply reply) override;

    [[nodiscard]] const std::string& remote() const noexcept { return remote_; }

private:
    boost::asio::awaitable<void> read_loop();
    boost::asio::awaitable<void> write_loop();

    // Executes queued requests until the queue drains or one blocks.
    void process_pending();

    void queue_reply(const Reply& reply);

    // Flushes what is queued, then closes.
    void close_after_flush();

    boost::asio::ip::tcp::socket socket_;
    uint64_t                     id_;
    command::Dispatcher&         dispatcher_;
    RequestParser                parser_;
    CloseHandler                 on_close_;
    std::string                  remote_;

    std::deque<Request> pending_;
    std::string         outbox_;

    // Used as a condition variable: the writer waits on it, cancel() wakes it.
    boost::asio::steady_timer write_signal_;
    // Wakes a reader paused behind a blocked command.
    boost::asio::steady_timer resume_signal_;

    bool blocked_ = false;
    bool closing_ = false;   // no more requests; close once outbox_ drains
    bool closed_  = false;
};

} // namespace memkv::network
