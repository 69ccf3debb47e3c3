#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolhost {

// How to launch one tool provider. Immutable once handed to the host.
struct ServerConfig {
    std::string id;
    std::string name;
    std::string description;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; // overrides on top of the host environment
    std::string cwd;                        // empty = host's working directory
    bool auto_start = false;
};

struct HostConfig {
    uint32_t handshake_timeout_ms = 10000;
    uint32_t tool_timeout_ms = 60000;
    uint32_t startup_timeout_ms = 30000; // spawn + handshake + discovery
    uint32_t stop_grace_ms = 5000;
    uint32_t max_servers = 10;           // running at once
    std::string log_level = "info";

    std::vector<ServerConfig> servers;

    // Load from ~/.toolhost/config.json + env vars
    static HostConfig load();

    // Load from an explicit path + env vars. A missing or malformed file
    // yields defaults.
    static HostConfig load_file(const std::string& path);

    // Parse without consulting the environment
    static HostConfig from_json(const nlohmann::json& j);

    static nlohmann::json defaults_json();

    // TOOLHOST_* environment variables override file values
    void apply_env();

    std::chrono::milliseconds handshake_timeout() const {
        return std::chrono::milliseconds(handshake_timeout_ms);
    }
    std::chrono::milliseconds tool_timeout() const {
        return std::chrono::milliseconds(tool_timeout_ms);
    }
    std::chrono::milliseconds startup_timeout() const {
        return std::chrono::milliseconds(startup_timeout_ms);
    }
    std::chrono::milliseconds stop_grace() const {
        return std::chrono::milliseconds(stop_grace_ms);
    }
};

// Read the standard {"<id>": {command, args, env, ...}} server map.
// Disabled entries and entries without a command are skipped.
std::vector<ServerConfig> parse_server_configs(const nlohmann::json& mcp_servers);

} // namespace toolhost
