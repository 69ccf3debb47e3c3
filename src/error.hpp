#pragma once
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace toolhost {

enum class ErrorKind {
    None,
    SpawnFailure,     // executable missing or unrunnable
    HandshakeFailure, // bad or missing protocol response during startup
    Timeout,          // no response before the deadline
    ConnectionLost,   // pipe closed or process exited
    NotRunning,       // operation needs a running server
    ToolNotFound,
    AlreadyExists,    // duplicate server id
    NotFound,         // unknown server id
    MalformedMessage, // non-JSON or shape-violating protocol line
    RemoteError,      // provider answered with a JSON-RPC error
    LimitReached,     // max_servers already running
    InvalidResponse,  // response arrived but its payload is unusable
};

// Stable lowercase name, e.g. "spawn_failure".
const char* error_kind_name(ErrorKind kind);

struct HostError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    int code = 0;          // JSON-RPC error code (RemoteError only)
    nlohmann::json data;   // JSON-RPC error data (RemoteError only)

    std::string describe() const;
};

inline HostError make_error(ErrorKind kind, std::string message) {
    HostError e;
    e.kind = kind;
    e.message = std::move(message);
    return e;
}

// Outcome of an operation with no value.
struct Status {
    bool success = true;
    HostError error;

    static Status ok() { return Status{}; }
    static Status fail(HostError err) {
        Status s;
        s.success = false;
        s.error = std::move(err);
        return s;
    }
    static Status fail(ErrorKind kind, std::string message) {
        return fail(make_error(kind, std::move(message)));
    }
};

// Outcome carrying a value on success.
template<typename T>
struct Result {
    bool success = false;
    T value{};
    HostError error;

    static Result ok(T v) {
        Result r;
        r.success = true;
        r.value = std::move(v);
        return r;
    }
    static Result fail(HostError err) {
        Result r;
        r.error = std::move(err);
        return r;
    }
    static Result fail(ErrorKind kind, std::string message) {
        return fail(make_error(kind, std::move(message)));
    }

    Status status() const {
        return success ? Status::ok() : Status::fail(error);
    }
};

} // namespace toolhost
