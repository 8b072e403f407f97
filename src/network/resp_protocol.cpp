#include "network/resp_protocol.hpp"

#include "common/errors.hpp"
#include "common/numeric.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <string>
#include <utility>
#include <variant>

namespace memkv::network {

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

// Split an inline request line on whitespace.
Request split_inline(std::string_view line) {
    Request parts;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && is_blank(line[i])) {
            ++i;
        }
        const std::size_t start = i;
        while (i < line.size() && !is_blank(line[i])) {
            ++i;
        }
        if (i > start) {
            parts.emplace_back(line.substr(start, i - start));
        }
    }
    return parts;
}

// Status and error lines cannot carry CR or LF.
void append_line_safe(std::string& out, std::string_view text) {
    for (char c : text) {
        out += (c == '\r' || c == '\n') ? ' ' : c;
    }
}

void append_bulk(std::string& out, std::string_view data) {
    out += '$';
    out += std::to_string(data.size());
    out += "\r\n";
    out.append(data.data(), data.size());
    out += "\r\n";
}

} // anonymous namespace

// ── RequestParser ─────────────────────────────────────────────────────────────

RequestParser::RequestParser(ProtocolLimits limits) : limits_(limits) {}

std::optional<std::string_view> RequestParser::take_line(std::string_view what) {
    const auto nl = buf_.find('\n', pos_);
    if (nl == std::string::npos) {
        if (buf_.size() - pos_ > limits_.max_inline_len) {
            throw ProtocolError(fmt::format("too big {}", what));
        }
        return std::nullopt;
    }
    std::string_view line{buf_.data() + pos_, nl - pos_};
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    pos_ = nl + 1;
    return line;
}

std::optional<Request> RequestParser::parse_one() {
    for (;;) {
        if (multibulk_remaining_ == 0) {
            if (pos_ >= buf_.size()) {
                return std::nullopt;
            }

            if (buf_[pos_] != '*') {
                // Inline request.
                auto line = take_line("inline request");
                if (!line) {
                    return std::nullopt;
                }
                Request args = split_inline(*line);
                if (args.empty()) {
                    continue;   // blank line
                }
                return args;
            }

            auto header = take_line("mbulk count string");
            if (!header) {
                return std::nullopt;
            }
            int64_t count = 0;
            if (!parse_int64(header->substr(1), count) ||
                count > static_cast<int64_t>(limits_.max_multibulk_len)) {
                throw ProtocolError("invalid multibulk length");
            }
            if (count < -1) {
                throw ProtocolError("invalid multibulk length");
            }
            if (count <= 0) {
                continue;   // "*0" and "*-1" carry no request
            }
            multibulk_remaining_ = count;
            current_.clear();
            current_.reserve(static_cast<std::size_t>(std::min<int64_t>(count, 1024)));
        }

        while (multibulk_remaining_ > 0) {
            if (bulk_len_ < 0) {
                auto header = take_line("bulk count string");
                if (!header) {
                    return std::nullopt;
                }
                if (header->empty() || header->front() != '$') {
                    throw ProtocolError(fmt::format(
                        "expected '$', got '{}'",
                        header->empty() ? std::string{} : std::string(1, header->front())));
                }
                int64_t len = 0;
                if (!parse_int64(header->substr(1), len) || len < 0 ||
                    static_cast<uint64_t>(len) > limits_.max_bulk_len) {
                    throw ProtocolError("invalid bulk length");
                }
                bulk_len_ = len;
            }

            const auto len = static_cast<std::size_t>(bulk_len_);
            if (buf_.size() - pos_ < len + 2) {
                return std::nullopt;
            }
            if (buf_[pos_ + len] != '\r' || buf_[pos_ + len + 1] != '\n') {
                throw ProtocolError("expected CRLF after bulk data");
            }
            current_.emplace_back(buf_, pos_, len);
            pos_ += len + 2;
            bulk_len_ = -1;
            --multibulk_remaining_;
        }

        return std::move(current_);
    }
}

std::vector<Request> RequestParser::feed(std::string_view bytes) {
    if (error_) {
        throw ProtocolError(*error_);
    }
    buf_.append(bytes.data(), bytes.size());

    std::vector<Request> out;
    try {
        while (auto request = parse_one()) {
            out.push_back(std::move(*request));
            current_ = Request{};
        }
    } catch (const ProtocolError& e) {
        if (out.empty()) {
            throw;
        }
        error_ = e.what();
        buf_.clear();
        pos_ = 0;
        return out;
    }

    // Drop consumed bytes; a partial frame stays at the front of buf_.
    buf_.erase(0, pos_);
    pos_ = 0;
    return out;
}

// ── Reply encoding ────────────────────────────────────────────────────────────

void encode_reply(const Reply& reply, std::string& out) {
    std::visit(
        [&out](const auto& r) {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, StatusReply>) {
                out += '+';
                append_line_safe(out, r.text);
                out += "\r\n";
            } else if constexpr (std::is_same_v<T, ErrorReply>) {
                out += '-';
                append_line_safe(out, r.message);
                out += "\r\n";
            } else if constexpr (std::is_same_v<T, IntegerReply>) {
                out += ':';
                out += std::to_string(r.value);
                out += "\r\n";
            } else if constexpr (std::is_same_v<T, BulkReply>) {
                if (!r.value) {
                    out += "$-1\r\n";
                } else {
                    append_bulk(out, *r.value);
                }
            } else if constexpr (std::is_same_v<T, ArrayReply>) {
                if (!r.elements) {
                    out += "*-1\r\n";
                } else {
                    out += '*';
                    out += std::to_string(r.elements->size());
                    out += "\r\n";
                    for (const auto& element : *r.elements) {
                        encode_reply(element, out);
                    }
                }
            }
        },
        reply.value);
}

std::string encode_reply(const Reply& reply) {
    std::string out;
    encode_reply(reply, out);
    return out;
}

// ── Client-side helpers ───────────────────────────────────────────────────────

std::string encode_request(const std::vector<std::string>& args) {
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& arg : args) {
        append_bulk(out, arg);
    }
    return out;
}

void ReplyParser::feed(std::string_view bytes) {
    buf_.append(bytes.data(), bytes.size());
}

std::optional<Reply> ReplyParser::next() {
    std::size_t p = pos_;
    auto reply = parse_at(p);
    if (reply) {
        pos_ = p;
        if (pos_ == buf_.size()) {
            buf_.clear();
            pos_ = 0;
        }
    }
    return reply;
}

std::optional<Reply> ReplyParser::parse_at(std::size_t& p) const {
    const auto eol = buf_.find("\r\n", p);
    if (eol == std::string::npos) {
        return std::nullopt;
    }
    const char type = buf_[p];
    const std::string_view payload{buf_.data() + p + 1, eol - p - 1};
    std::size_t after = eol + 2;

    switch (type) {
        case '+':
            p = after;
            return Reply{StatusReply{std::string(payload)}};
        case '-':
            p = after;
            return Reply{ErrorReply{std::string(payload)}};
        case ':': {
            int64_t value = 0;
            if (!parse_int64(payload, value)) {
                throw ProtocolError("invalid integer reply");
            }
            p = after;
            return Reply{IntegerReply{value}};
        }
        case '$': {
            int64_t len = 0;
            if (!parse_int64(payload, len) || len < -1) {
                throw ProtocolError("invalid bulk length");
            }
            if (len == -1) {
                p = after;
                return reply::nil_bulk();
            }
            const auto n = static_cast<std::size_t>(len);
            if (buf_.size() - after < n + 2) {
                return std::nullopt;
            }
            p = after + n + 2;
            return reply::bulk(buf_.substr(after, n));
        }
        case '*': {
            int64_t count = 0;
            if (!parse_int64(payload, count) || count < -1) {
                throw ProtocolError("invalid multibulk length");
            }
            if (count == -1) {
                p = after;
                return reply::nil_array();
            }
            std::vector<Reply> elements;
            elements.reserve(static_cast<std::size_t>(std::min<int64_t>(count, 1024)));
            std::size_t q = after;
            for (int64_t i = 0; i < count; ++i) {
                auto element = parse_at(q);
                if (!element) {
                    return std::nullopt;
                }
                elements.push_back(std::move(*element));
            }
            p = q;
            return reply::array(std::move(elements));
        }
        default:
            throw ProtocolError(fmt::format("unknown reply type '{}'", type));
    }
}

} // namespace memkv::network
