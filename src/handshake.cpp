#include "handshake.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include <algorithm>

namespace toolhost {

namespace {

constexpr int kMaxToolPages = 64;

std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

// Protocol-level rejections become HandshakeFailure; timeouts and lost
// connections keep their own kind.
HostError as_handshake_error(const HostError& err, const std::string& step) {
    if (err.kind == ErrorKind::Timeout || err.kind == ErrorKind::ConnectionLost) {
        return make_error(err.kind, step + ": " + err.message);
    }
    return make_error(ErrorKind::HandshakeFailure, step + ": " + err.describe());
}

} // namespace

const char* handshake_state_name(HandshakeState state) {
    switch (state) {
        case HandshakeState::NotStarted:   return "not_started";
        case HandshakeState::Initializing: return "initializing";
        case HandshakeState::Initialized:  return "initialized";
        case HandshakeState::Discovering:  return "discovering";
        case HandshakeState::Ready:        return "ready";
        case HandshakeState::Failed:       return "failed";
    }
    return "unknown";
}

Result<ServerInfo> parse_initialize_result(const nlohmann::json& result) {
    if (!result.is_object()) {
        return Result<ServerInfo>::fail(ErrorKind::HandshakeFailure,
                                        "initialize result is not an object");
    }
    if (!result.contains("protocolVersion") || !result["protocolVersion"].is_string()) {
        return Result<ServerInfo>::fail(ErrorKind::HandshakeFailure,
                                        "initialize result has no protocolVersion");
    }

    ServerInfo info;
    info.protocol_version = result["protocolVersion"].get<std::string>();
    if (result.contains("capabilities") && result["capabilities"].is_object())
        info.capabilities = result["capabilities"];
    if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
        const auto& si = result["serverInfo"];
        if (si.contains("name") && si["name"].is_string())
            info.name = si["name"].get<std::string>();
        if (si.contains("version") && si["version"].is_string())
            info.version = si["version"].get<std::string>();
    }
    if (result.contains("instructions") && result["instructions"].is_string())
        info.instructions = result["instructions"].get<std::string>();
    return Result<ServerInfo>::ok(std::move(info));
}

Result<std::vector<ToolDescriptor>> discover_tools(Connection& connection,
                                                   const std::string& server_id,
                                                   std::chrono::milliseconds timeout,
                                                   std::chrono::steady_clock::time_point deadline) {
    using R = Result<std::vector<ToolDescriptor>>;
    std::vector<ToolDescriptor> tools;
    std::string cursor;

    for (int page = 0; page < kMaxToolPages; ++page) {
        nlohmann::json params = nullptr;
        if (!cursor.empty()) params = {{"cursor", cursor}};

        auto left = remaining(deadline);
        if (left.count() == 0) {
            return R::fail(ErrorKind::Timeout, "tools/list did not finish within the deadline (" +
                           std::to_string(tools.size()) + " tool(s) read over " +
                           std::to_string(page) + " page(s))");
        }
        auto response = connection.request(protocol::method::ToolsList, params,
                                           std::min(timeout, left));
        if (!response.success) {
            return R::fail(response.error);
        }

        const auto& result = response.value;
        if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
            return R::fail(ErrorKind::MalformedMessage, "tools/list result has no tools array");
        }
        for (const auto& entry : result["tools"]) {
            ToolDescriptor tool;
            if (!parse_tool_descriptor(entry, server_id, tool)) {
                log_warn(server_id, "Skipping tool without a name: " + entry.dump());
                continue;
            }
            tools.push_back(std::move(tool));
        }

        if (result.contains("nextCursor") && result["nextCursor"].is_string() &&
            !result["nextCursor"].get<std::string>().empty()) {
            cursor = result["nextCursor"].get<std::string>();
        } else {
            return R::ok(std::move(tools));
        }
    }

    log_warn(server_id, "tools/list still paginating after " +
             std::to_string(kMaxToolPages) + " pages; keeping what was read");
    return R::ok(std::move(tools));
}

Handshake::Handshake(Connection& connection, std::string server_id)
    : connection_(connection), server_id_(std::move(server_id)) {}

Status Handshake::fail(HostError error) {
    state_ = HandshakeState::Failed;
    return Status::fail(std::move(error));
}

Status Handshake::run(std::chrono::milliseconds step_timeout,
                      std::chrono::steady_clock::time_point deadline) {
    if (state_ != HandshakeState::NotStarted) {
        return fail(make_error(ErrorKind::HandshakeFailure, "handshake already attempted"));
    }

    state_ = HandshakeState::Initializing;
    auto init = connection_.request(protocol::method::Initialize, initialize_params(),
                                    std::min(step_timeout, remaining(deadline)));
    if (!init.success) {
        return fail(as_handshake_error(init.error, "initialize"));
    }
    auto info = parse_initialize_result(init.value);
    if (!info.success) {
        return fail(info.error);
    }
    info_ = std::move(info.value);

    state_ = HandshakeState::Initialized;
    Status notified = connection_.send(make_notification(protocol::method::Initialized));
    if (!notified.success) {
        return fail(as_handshake_error(notified.error, "initialized"));
    }

    state_ = HandshakeState::Discovering;
    auto tools = discover_tools(connection_, server_id_, step_timeout, deadline);
    if (!tools.success) {
        return fail(as_handshake_error(tools.error, "tools/list"));
    }
    tools_ = std::move(tools.value);

    state_ = HandshakeState::Ready;
    log_debug(server_id_, "Handshake complete: protocol " + info_.protocol_version + ", " +
              std::to_string(tools_.size()) + " tool(s)");
    return Status::ok();
}

} // namespace toolhost
