#pragma once

#include "network/reply.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace memkv::network {

// One client request: command name followed by its arguments, binary safe.
using Request = std::vector<std::string>;

// ── Protocol limits ───────────────────────────────────────────────────────────

struct ProtocolLimits {
    uint64_t max_bulk_len      = 512ULL * 1024 * 1024;  // bytes per argument
    uint32_t max_multibulk_len = 1024 * 1024;           // arguments per request
    uint32_t max_inline_len    = 64 * 1024;             // unterminated line bytes
};

// ── RequestParser ─────────────────────────────────────────────────────────────
//
// Incremental RESP request parser.  Accepts both framings:
//
//   inline      SET key value\r\n          (whitespace separated, '\r' optional)
//   multi-bulk  *3\r\n$3\r\nSET\r\n$3\r\nkey\r\n$5\r\nvalue\r\n
//
// Bytes may arrive split at any boundary; the parser keeps its state between
// feed() calls and only yields a request once every declared length is
// satisfied.  Blank inline lines and "*0" / "*-1" headers yield nothing.
//
// Limit violations and malformed frames throw ProtocolError; the connection
// is unusable afterwards.  When requests were completed earlier in the same
// feed() call they are returned instead and the error is held in error().

class RequestParser {
public:
    explicit RequestParser(ProtocolLimits limits = {});

    // Appends `bytes` and returns every request completed by them, in order.
    // Throws ProtocolError on a malformed frame, or on any call after an
    // error has been held.
    [[nodiscard]] std::vector<Request> feed(std::string_view bytes);

    // Protocol error found after the requests returned by the last feed().
    [[nodiscard]] const std::optional<std::string>& error() const noexcept { return error_; }

    // Bytes received but not yet consumed by a complete request.
    [[nodiscard]] std::size_t buffered() const noexcept { return buf_.size() - pos_; }

private:
    // Parses the next request starting at pos_.  nullopt = need more bytes.
    std::optional<Request> parse_one();

    // Returns the line starting at pos_ without its terminator, advancing
    // pos_ past it; nullopt if no '\n' has arrived yet.
    std::optional<std::string_view> take_line(std::string_view what);

    ProtocolLimits limits_;

    std::string buf_;
    std::size_t pos_ = 0;

    // Multi-bulk state: arguments still expected and the pending bulk length
    // (-1 while waiting for a "$<len>" header).
    int64_t multibulk_remaining_ = 0;
    int64_t bulk_len_            = -1;
    Request current_;

    std::optional<std::string> error_;
};

// ── Reply encoding ────────────────────────────────────────────────────────────

// Serialize a Reply into RESP wire format.
[[nodiscard]] std::string encode_reply(const Reply& reply);

// Appends the encoding of `reply` to `out`.
void encode_reply(const Reply& reply, std::string& out);

// ── Client-side helpers (memkv-cli, tests) ────────────────────────────────────

// Serialize arguments as a multi-bulk request.
[[nodiscard]] std::string encode_request(const std::vector<std::string>& args);

// Incremental decoder for server replies: the inverse of encode_reply().
class ReplyParser {
public:
    void feed(std::string_view bytes);

    // Next complete reply, or nullopt if more bytes are needed.  Throws
    // ProtocolError on malformed input.
    [[nodiscard]] std::optional<Reply> next();

private:
    std::optional<Reply> parse_at(std::size_t& p) const;

    std::string buf_;
    std::size_t pos_ = 0;
};

} // namespace memkv::network
