#include "error.hpp"

namespace toolhost {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return "none";
        case ErrorKind::SpawnFailure:     return "spawn_failure";
        case ErrorKind::HandshakeFailure: return "handshake_failure";
        case ErrorKind::Timeout:          return "timeout";
        case ErrorKind::ConnectionLost:   return "connection_lost";
        case ErrorKind::NotRunning:       return "not_running";
        case ErrorKind::ToolNotFound:     return "tool_not_found";
        case ErrorKind::AlreadyExists:    return "already_exists";
        case ErrorKind::NotFound:         return "not_found";
        case ErrorKind::MalformedMessage: return "malformed_message";
        case ErrorKind::RemoteError:      return "remote_error";
        case ErrorKind::LimitReached:     return "limit_reached";
        case ErrorKind::InvalidResponse:  return "invalid_response";
    }
    return "unknown";
}

std::string HostError::describe() const {
    std::string out = error_kind_name(kind);
    if (kind == ErrorKind::RemoteError) {
        out += " (" + std::to_string(code) + ")";
    }
    if (!message.empty()) {
        out += ": " + message;
    }
    return out;
}

} // namespace toolhost
