#include "config.hpp"
#include "log.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>

namespace toolhost {

nlohmann::json HostConfig::defaults_json() {
    return {
        {"handshake_timeout_ms", 10000},
        {"tool_timeout_ms", 60000},
        {"startup_timeout_ms", 30000},
        {"stop_grace_ms", 5000},
        {"max_servers", 10},
        {"log_level", "info"},
        {"mcpServers", nlohmann::json::object()}
    };
}

static void read_u32(const nlohmann::json& j, const char* key, uint32_t& out) {
    if (j.contains(key) && j[key].is_number_integer() && j[key].get<int64_t>() >= 0)
        out = static_cast<uint32_t>(j[key].get<int64_t>());
}

static std::string string_field(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return {};
}

std::vector<ServerConfig> parse_server_configs(const nlohmann::json& mcp_servers) {
    std::vector<ServerConfig> out;
    if (!mcp_servers.is_object()) return out;

    for (auto& [id, obj] : mcp_servers.items()) {
        if (!obj.is_object()) continue;
        if (obj.contains("disabled") && obj["disabled"].is_boolean() &&
            obj["disabled"].get<bool>()) {
            continue;
        }
        if (!obj.contains("command") || !obj["command"].is_string() ||
            obj["command"].get<std::string>().empty()) {
            log_warn("config", "Skipping server " + id + ": no command");
            continue;
        }

        ServerConfig sc;
        sc.id = id;
        sc.command = obj["command"].get<std::string>();
        sc.name = string_field(obj, "name");
        if (sc.name.empty()) sc.name = name_from_id(id);
        sc.description = string_field(obj, "description");
        sc.cwd = string_field(obj, "cwd");
        if (obj.contains("args") && obj["args"].is_array()) {
            for (const auto& a : obj["args"]) {
                if (a.is_string()) sc.args.push_back(a.get<std::string>());
            }
        }
        if (obj.contains("env") && obj["env"].is_object()) {
            for (auto& [key, value] : obj["env"].items()) {
                if (value.is_string()) sc.env[key] = value.get<std::string>();
            }
        }
        if (obj.contains("autoStart") && obj["autoStart"].is_boolean())
            sc.auto_start = obj["autoStart"].get<bool>();
        out.push_back(std::move(sc));
    }
    return out;
}

HostConfig HostConfig::from_json(const nlohmann::json& j) {
    HostConfig cfg;
    if (!j.is_object()) return cfg;

    read_u32(j, "handshake_timeout_ms", cfg.handshake_timeout_ms);
    read_u32(j, "tool_timeout_ms", cfg.tool_timeout_ms);
    read_u32(j, "startup_timeout_ms", cfg.startup_timeout_ms);
    read_u32(j, "stop_grace_ms", cfg.stop_grace_ms);
    read_u32(j, "max_servers", cfg.max_servers);
    if (j.contains("log_level") && j["log_level"].is_string())
        cfg.log_level = j["log_level"].get<std::string>();
    if (j.contains("mcpServers"))
        cfg.servers = parse_server_configs(j["mcpServers"]);
    return cfg;
}

static void env_u32(const char* name, uint32_t& out) {
    const char* v = std::getenv(name);
    if (!v) return;
    try {
        size_t used = 0;
        unsigned long parsed = std::stoul(v, &used);
        if (used == std::string(v).size()) {
            out = static_cast<uint32_t>(parsed);
            return;
        }
    } catch (const std::exception&) {
        // fall through to the warning
    }
    log_warn("config", std::string("Ignoring ") + name + "=" + v + " (not a number)");
}

void HostConfig::apply_env() {
    env_u32("TOOLHOST_HANDSHAKE_TIMEOUT_MS", handshake_timeout_ms);
    env_u32("TOOLHOST_TOOL_TIMEOUT_MS", tool_timeout_ms);
    if (const char* v = std::getenv("TOOLHOST_LOG_LEVEL"))
        log_level = v;
}

HostConfig HostConfig::load_file(const std::string& path) {
    HostConfig cfg;
    std::ifstream file(path);
    if (file.is_open()) {
        try {
            cfg = from_json(nlohmann::json::parse(file));
        } catch (const nlohmann::json::exception& e) {
            log_warn("config", "Malformed config " + path + ", using defaults: " + e.what());
            cfg = HostConfig{};
        }
    }
    cfg.apply_env();
    return cfg;
}

HostConfig HostConfig::load() {
    return load_file(expand_home("~/.toolhost/config.json"));
}

} // namespace toolhost
