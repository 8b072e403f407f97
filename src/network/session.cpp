#include "network/session.hpp"

#include "command/arguments.hpp"
#include "common/errors.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <utility>

namespace memkv::network {

namespace {

constexpr std::size_t kReadChunk = 16 * 1024;

// Requests kept queued behind a blocked command before reading pauses.
constexpr std::size_t kMaxHeldRequests = 1024;

bool is_disconnect(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof ||
           ec == boost::asio::error::connection_reset ||
           ec == boost::asio::error::operation_aborted ||
           ec == boost::asio::error::broken_pipe;
}

} // anonymous namespace

Session::Session(boost::asio::ip::tcp::socket socket, uint64_t id,
                 command::Dispatcher& dispatcher, ProtocolLimits limits,
                 CloseHandler on_close)
    : socket_(std::move(socket)),
      id_(id),
      dispatcher_(dispatcher),
      parser_(limits),
      on_close_(std::move(on_close)),
      write_signal_(socket_.get_executor()),
      resume_signal_(socket_.get_executor()) {
    boost::system::error_code ec;
    const auto ep = socket_.remote_endpoint(ec);
    remote_ = ec ? "<unknown>" : ep.address().to_string() + ":" + std::to_string(ep.port());
    write_signal_.expires_at(boost::asio::steady_timer::time_point::max());
    resume_signal_.expires_at(boost::asio::steady_timer::time_point::max());
}

void Session::start() {
    dispatcher_.client_connected(id_, remote_);

    auto self = shared_from_this();
    boost::asio::co_spawn(
        socket_.get_executor(),
        [self]() -> boost::asio::awaitable<void> { co_await self->read_loop(); },
        boost::asio::detached);
    boost::asio::co_spawn(
        socket_.get_executor(),
        [self]() -> boost::asio::awaitable<void> { co_await self->write_loop(); },
        boost::asio::detached);
}

// ── Reader ────────────────────────────────────────────────────────────────────

boost::asio::awaitable<void> Session::read_loop() {
    std::array<char, kReadChunk> chunk{};

    while (!closed_ && !closing_) {
        if (blocked_ && pending_.size() >= kMaxHeldRequests) {
            // Leave further input in the socket until the blocked command
            // completes.
            boost::system::error_code ec;
            co_await resume_signal_.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            continue;
        }

        boost::system::error_code ec;
        const std::size_t n = co_await socket_.async_read_some(
            boost::asio::buffer(chunk),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec) {
            if (!is_disconnect(ec)) {
                spdlog::warn("Session {}: read error: {}", remote_, ec.message());
            }
            close();
            break;
        }

        std::optional<std::string> failure;
        try {
            for (auto& request : parser_.feed({chunk.data(), n})) {
                pending_.push_back(std::move(request));
            }
            failure = parser_.error();
        } catch (const ProtocolError& e) {
            failure = e.what();
        }

        if (failure) {
            spdlog::debug("Session {}: protocol error: {}", remote_, *failure);
            // Requests completed before the bad frame still run first.
            process_pending();
            queue_reply(reply::error("ERR Protocol error: " + *failure));
            close_after_flush();
            break;
        }

        process_pending();
    }
}

void Session::process_pending() {
    std::shared_ptr<command::Client> self = shared_from_this();

    while (!pending_.empty() && !blocked_ && !closing_ && !closed_) {
        Request request = std::move(pending_.front());
        pending_.pop_front();

        if (command::iequals(request.front(), "quit")) {
            queue_reply(reply::ok());
            close_after_flush();
            return;
        }

        auto result = dispatcher_.execute(self, request);
        if (!result) {
            blocked_ = true;
            return;
        }
        queue_reply(*result);
    }
}

void Session::deliver(Reply reply) {
    if (closed_) {
        return;
    }
    queue_reply(reply);
    blocked_ = false;

    // Resume on a fresh stack: deliver() runs inside another client's
    // command execution.
    boost::asio::post(socket_.get_executor(),
                      [self = shared_from_this()] {
                          self->process_pending();
                          self->resume_signal_.cancel();
                      });
}

// ── Writer ────────────────────────────────────────────────────────────────────

void Session::queue_reply(const Reply& reply) {
    encode_reply(reply, outbox_);
    write_signal_.cancel();
}

boost::asio::awaitable<void> Session::write_loop() {
    std::string writing;

    while (!closed_) {
        if (outbox_.empty()) {
            if (closing_) {
                close();
                break;
            }
            boost::system::error_code ec;
            co_await write_signal_.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            continue;   // woken by cancel(): re-check state
        }

        writing.clear();
        writing.swap(outbox_);

        boost::system::error_code ec;
        co_await boost::asio::async_write(
            socket_, boost::asio::buffer(writing),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec) {
            if (!is_disconnect(ec)) {
                spdlog::warn("Session {}: write error: {}", remote_, ec.message());
            }
            close();
            break;
        }
    }
}

// ── Shutdown ──────────────────────────────────────────────────────────────────

void Session::close_after_flush() {
    closing_ = true;
    pending_.clear();
    write_signal_.cancel();
}

void Session::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    pending_.clear();

    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    if (ec) {
        spdlog::debug("Session {}: close: {}", remote_, ec.message());
    }
    write_signal_.cancel();
    resume_signal_.cancel();

    dispatcher_.client_disconnected(id_);
    if (on_close_) {
        on_close_(id_);
    }
}

} // namespace memkv::network
