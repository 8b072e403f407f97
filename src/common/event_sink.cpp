#include "common/event_sink.hpp"

#include <utility>

namespace memkv {

std::string_view event_kind_name(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::ClientConnected:    return "client_connected";
        case EventKind::ClientDisconnected: return "client_disconnected";
        case EventKind::CommandExecuted:    return "command_executed";
        case EventKind::CommandFailed:      return "command_failed";
        case EventKind::KeysExpired:        return "keys_expired";
    }
    return "unknown";
}

LogEventSink::LogEventSink(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

void LogEventSink::emit(const Event& event) {
    switch (event.kind) {
        case EventKind::ClientConnected:
            logger_->info("client #{} connected from {}", event.client_id, event.detail);
            break;
        case EventKind::ClientDisconnected:
            logger_->info("client #{} disconnected", event.client_id);
            break;
        case EventKind::CommandExecuted:
            logger_->trace("client #{} {}", event.client_id, event.command);
            break;
        case EventKind::CommandFailed:
            logger_->debug("client #{} {} failed: {}",
                           event.client_id, event.command, event.detail);
            break;
        case EventKind::KeysExpired:
            logger_->debug("active expire evicted {} keys", event.detail);
            break;
    }
}

} // namespace memkv
