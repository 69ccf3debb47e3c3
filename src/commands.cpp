#include "commands.hpp"
#include "host.hpp"
#include "tool.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>

namespace toolhost {

std::string cmd_servers(const Host& host) {
    auto servers = host.list_servers();
    if (servers.empty()) return "No servers configured.";

    std::string result = "Servers:\n";
    for (const auto& s : servers) {
        result += "  " + s.id + " [" + server_status_name(s.status) + "] "
            + std::to_string(s.tool_count) + " tool(s)";
        if (s.pid) result += ", pid " + std::to_string(*s.pid);
        if (!s.server_name.empty()) result += ", " + s.server_name;
        result += "\n";
        if (s.last_error) result += "    last error: " + *s.last_error + "\n";
    }
    return result;
}

std::string cmd_tools(const Host& host, const std::string& server_id) {
    std::optional<std::string> scope;
    if (!server_id.empty()) scope = server_id;

    auto tools = host.list_tools(scope);
    if (tools.empty()) {
        return scope ? "No tools on " + server_id + "." : "No tools available.";
    }

    std::string result;
    for (const auto& t : tools) {
        result += "  " + t.server + "/" + t.name;
        if (!t.description.empty()) result += " - " + t.description;
        result += "\n";
    }
    return result;
}

std::string cmd_help() {
    return "Commands:\n"
           "  /servers                    List servers and their status\n"
           "  /tools [SERVER]             List discovered tools\n"
           "  /start ID                   Start a server\n"
           "  /stop ID                    Stop a server\n"
           "  /refresh ID                 Re-run tool discovery\n"
           "  /call SERVER TOOL [JSON]    Execute a tool\n"
           "  /help                       Show this help\n"
           "  /quit                       Stop all servers and exit\n";
}

std::string cmd_start(Host& host, const std::string& server_id) {
    if (server_id.empty()) return "Usage: /start ID";
    Status s = host.start_server(server_id);
    if (!s.success) return "Failed to start " + server_id + ": " + s.error.describe();

    auto snap = host.server(server_id);
    size_t count = snap.success ? snap.value.tool_count : 0;
    return "Started " + server_id + " (" + std::to_string(count) + " tool(s))";
}

std::string cmd_stop(Host& host, const std::string& server_id) {
    if (server_id.empty()) return "Usage: /stop ID";
    Status s = host.stop_server(server_id);
    if (!s.success) return "Failed to stop " + server_id + ": " + s.error.describe();
    return "Stopped " + server_id;
}

std::string cmd_refresh(Host& host, const std::string& server_id) {
    if (server_id.empty()) return "Usage: /refresh ID";
    Status s = host.refresh_tools(server_id);
    if (!s.success) return "Refresh failed: " + s.error.describe();
    return cmd_tools(host, server_id);
}

std::string cmd_call(Host& host, const std::string& args) {
    auto [server_id, rest] = split_first_word(args);
    auto [tool, json_text] = split_first_word(rest);
    if (server_id.empty() || tool.empty()) {
        return "Usage: /call SERVER TOOL [JSON]";
    }

    ToolCall call;
    call.server = server_id;
    call.tool = tool;
    if (!json_text.empty()) {
        try {
            call.parameters = nlohmann::json::parse(json_text);
        } catch (const nlohmann::json::parse_error& e) {
            return std::string("Invalid JSON arguments: ") + e.what();
        }
        if (!call.parameters.is_object()) {
            return "Tool arguments must be a JSON object";
        }
    }

    auto result = host.execute_tool(call);
    if (!result.success) return "Error: " + result.error.describe();

    std::string text = tool_result_text(result.value);
    if (tool_result_is_error(result.value)) return "Tool reported an error: " + text;
    return text;
}

std::string run_command(Host& host, const std::string& line) {
    auto [command, args] = split_first_word(line);

    if (command == "/servers") return cmd_servers(host);
    if (command == "/tools") return cmd_tools(host, args);
    if (command == "/start") return cmd_start(host, args);
    if (command == "/stop") return cmd_stop(host, args);
    if (command == "/refresh") return cmd_refresh(host, args);
    if (command == "/call") return cmd_call(host, args);
    if (command == "/help") return cmd_help();
    return "Unknown command: " + command + " (try /help)";
}

} // namespace toolhost
