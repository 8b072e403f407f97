#include "common/errors.hpp"
#include "common/logger.hpp"
#include "network/reply.hpp"
#include "network/resp_protocol.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/program_options.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace po = boost::program_options;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

// Splits a REPL line into arguments.  Double quotes group words and accept
// \n, \r, \t, \" and \\ escapes; single quotes group words verbatim.
// Returns nullopt on an unbalanced quote.
std::optional<std::vector<std::string>> split_args(const std::string& line) {
    std::vector<std::string> args;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) {
            ++i;
        }
        if (i == line.size()) {
            break;
        }

        std::string current;
        bool in_token = true;
        while (in_token && i < line.size()) {
            const char c = line[i];
            if (c == '"' || c == '\'') {
                const char quote = c;
                ++i;
                bool closed = false;
                while (i < line.size()) {
                    char q = line[i++];
                    if (q == quote) {
                        closed = true;
                        break;
                    }
                    if (quote == '"' && q == '\\' && i < line.size()) {
                        const char e = line[i++];
                        switch (e) {
                            case 'n': q = '\n'; break;
                            case 'r': q = '\r'; break;
                            case 't': q = '\t'; break;
                            default:  q = e;    break;
                        }
                    }
                    current += q;
                }
                if (!closed) {
                    return std::nullopt;
                }
            } else if (std::isspace(static_cast<unsigned char>(c))) {
                in_token = false;
            } else {
                current += c;
                ++i;
            }
        }
        args.push_back(std::move(current));
    }
    return args;
}

bool is_quit(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name == "quit";
}

// Sends one request and waits for exactly one reply.
asio::awaitable<std::optional<memkv::Reply>>
round_trip(tcp::socket& socket, memkv::network::ReplyParser& parser,
           const std::vector<std::string>& args) {
    const std::string wire = memkv::network::encode_request(args);

    boost::system::error_code ec;
    co_await asio::async_write(socket, asio::buffer(wire),
                               asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        spdlog::error("memkv-cli: send error: {}", ec.message());
        co_return std::nullopt;
    }

    std::array<char, 16 * 1024> chunk{};
    for (;;) {
        if (auto reply = parser.next()) {
            co_return reply;
        }
        const std::size_t n = co_await socket.async_read_some(
            asio::buffer(chunk), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (ec == asio::error::eof) {
                fprintf(stdout, "Server disconnected.\n");
            } else {
                spdlog::error("memkv-cli: recv error: {}", ec.message());
            }
            co_return std::nullopt;
        }
        parser.feed({chunk.data(), n});
    }
}

// ── REPL coroutine ────────────────────────────────────────────────────────────

asio::awaitable<void> repl(tcp::socket socket, std::string prompt,
                           std::vector<std::string> one_shot) {
    memkv::network::ReplyParser parser;

    try {
        if (!one_shot.empty()) {
            if (auto reply = co_await round_trip(socket, parser, one_shot)) {
                fprintf(stdout, "%s\n", memkv::to_display_string(*reply).c_str());
            }
            co_return;
        }

        std::string line;
        while (true) {
            fprintf(stdout, "%s> ", prompt.c_str());
            fflush(stdout);

            if (!std::getline(std::cin, line)) {
                fprintf(stdout, "\n");
                break;
            }

            auto args = split_args(line);
            if (!args) {
                fprintf(stdout, "Invalid argument(s)\n");
                continue;
            }
            if (args->empty()) {
                continue;
            }

            auto reply = co_await round_trip(socket, parser, *args);
            if (!reply) {
                break;
            }
            fprintf(stdout, "%s\n", memkv::to_display_string(*reply).c_str());

            if (is_quit(args->front())) {
                break;
            }
        }
    } catch (const memkv::ProtocolError& e) {
        spdlog::error("memkv-cli: malformed reply: {}", e.what());
    }
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    po::options_description desc("memkv-cli options");
    desc.add_options()
        ("help,h",                                            "Show this help")
        ("host",   po::value<std::string>()->default_value("127.0.0.1"), "Server host")
        ("port,p", po::value<std::uint16_t>()->default_value(6379),      "Server port")
        ("log-level,l", po::value<std::string>()->default_value("warn"), "Log level")
        ("command", po::value<std::vector<std::string>>(),
                    "Command to run once instead of starting the REPL");

    po::positional_options_description positional;
    positional.add("command", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        fprintf(stderr, "Argument error: %s\n", e.what());
        return 1;
    }

    if (vm.count("help")) {
        std::ostringstream oss;
        oss << desc;
        fprintf(stdout, "Usage: memkv-cli [options] [command [arg ...]]\n%s\n", oss.str().c_str());
        return 0;
    }

    const auto host      = vm["host"].as<std::string>();
    const auto port      = vm["port"].as<std::uint16_t>();
    const auto log_level = vm["log-level"].as<std::string>();
    std::vector<std::string> one_shot;
    if (vm.count("command")) {
        one_shot = vm["command"].as<std::vector<std::string>>();
    }

    memkv::init_default_logger(memkv::parse_log_level(log_level));

    spdlog::debug("memkv-cli connecting to {}:{}", host, port);

    try {
        asio::io_context ioc;
        tcp::resolver resolver{ioc};
        auto endpoints = resolver.resolve(host, std::to_string(port));

        tcp::socket socket{ioc};
        boost::system::error_code ec;
        asio::connect(socket, endpoints, ec);

        if (ec) {
            spdlog::error("memkv-cli: failed to connect to {}:{} – {}", host, port, ec.message());
            return 1;
        }

        socket.set_option(tcp::no_delay(true));

        const std::string prompt = host + ":" + std::to_string(port);
        asio::co_spawn(ioc, repl(std::move(socket), prompt, std::move(one_shot)), asio::detached);
        ioc.run();

    } catch (const std::exception& ex) {
        spdlog::error("memkv-cli: exception: {}", ex.what());
        return 1;
    }

    return 0;
}
