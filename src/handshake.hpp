#pragma once
#include "connection.hpp"
#include "error.hpp"
#include "tool.hpp"
#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolhost {

enum class HandshakeState {
    NotStarted,
    Initializing,
    Initialized,
    Discovering,
    Ready,
    Failed,
};

const char* handshake_state_name(HandshakeState state);

// What the provider told us about itself in the initialize response.
struct ServerInfo {
    std::string protocol_version;
    nlohmann::json capabilities = nlohmann::json::object();
    std::string name;
    std::string version;
    std::string instructions;
};

// initialize -> notifications/initialized -> tools/list.
// Strictly sequential; any failure ends in Failed and stays there.
class Handshake {
public:
    Handshake(Connection& connection, std::string server_id);

    // Each step waits at most `step_timeout`, and never past `deadline`.
    Status run(std::chrono::milliseconds step_timeout,
               std::chrono::steady_clock::time_point deadline);

    HandshakeState state() const { return state_; }
    const ServerInfo& server_info() const { return info_; }
    const std::vector<ToolDescriptor>& tools() const { return tools_; }

private:
    Status fail(HostError error);

    Connection& connection_;
    std::string server_id_;
    HandshakeState state_ = HandshakeState::NotStarted;
    ServerInfo info_;
    std::vector<ToolDescriptor> tools_;
};

// Validate an initialize result and extract the provider's details.
Result<ServerInfo> parse_initialize_result(const nlohmann::json& result);

// tools/list, following nextCursor pages. Zero tools is a valid answer;
// a result without a "tools" array is not. Each page waits at most
// `timeout`, and the whole listing fails with Timeout once `deadline` passes.
Result<std::vector<ToolDescriptor>> discover_tools(Connection& connection,
                                                   const std::string& server_id,
                                                   std::chrono::milliseconds timeout,
                                                   std::chrono::steady_clock::time_point deadline);

} // namespace toolhost
