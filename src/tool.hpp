#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolhost {

// One callable operation discovered on a server. Names are unique within
// a server only.
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema; // JSON schema for arguments
    std::string server;          // owning server id
};

// A caller's request to run `tool` on `server`.
struct ToolCall {
    std::string tool;
    nlohmann::json parameters = nlohmann::json::object();
    std::string server;
};

// Parse one entry of a tools/list result. Returns false when the entry has
// no string name.
bool parse_tool_descriptor(const nlohmann::json& j, const std::string& server,
                           ToolDescriptor& out);

nlohmann::json to_json(const ToolDescriptor& tool);

// Concatenated text of the "content" blocks of a tools/call result, or the
// compact JSON dump when there is no text content.
std::string tool_result_text(const nlohmann::json& result);

// True when a tools/call result reports a tool-level failure ("isError").
bool tool_result_is_error(const nlohmann::json& result);

} // namespace toolhost
