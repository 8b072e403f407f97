#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace memkv {

// ── Events ────────────────────────────────────────────────────────────────────
//
// Structured records emitted by the core (dispatcher, server, sessions).
// The core never formats log lines itself; it hands events to an injected
// EventSink and the sink decides what to do with them.

enum class EventKind : uint8_t {
    ClientConnected,
    ClientDisconnected,
    CommandExecuted,
    CommandFailed,
    KeysExpired,
};

[[nodiscard]] std::string_view event_kind_name(EventKind kind) noexcept;

struct Event {
    EventKind   kind;
    uint64_t    client_id = 0;   // 0 when not tied to a connection
    std::string command;         // lower-case command name, if any
    std::string detail;          // peer address, error message, key count, …
};

class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void emit(const Event& event) = 0;
};

// Discards everything.  Used where nobody cares (benchmarks, some tests).
class NullEventSink final : public EventSink {
public:
    void emit(const Event&) override {}
};

// ── LogEventSink ──────────────────────────────────────────────────────────────
//
// Production sink: writes each event to an spdlog logger.
//   connections   → info
//   failures      → debug (client mistakes are not server problems)
//   commands      → trace
//   expirations   → debug

class LogEventSink final : public EventSink {
public:
    explicit LogEventSink(std::shared_ptr<spdlog::logger> logger);

    void emit(const Event& event) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace memkv
