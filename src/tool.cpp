#include "tool.hpp"

namespace toolhost {

bool parse_tool_descriptor(const nlohmann::json& j, const std::string& server,
                           ToolDescriptor& out) {
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) {
        return false;
    }
    out.name = j["name"].get<std::string>();
    out.description = (j.contains("description") && j["description"].is_string())
        ? j["description"].get<std::string>() : "";
    out.input_schema = (j.contains("inputSchema") && j["inputSchema"].is_object())
        ? j["inputSchema"] : nlohmann::json{{"type", "object"}};
    out.server = server;
    return !out.name.empty();
}

nlohmann::json to_json(const ToolDescriptor& tool) {
    return {
        {"name", tool.name},
        {"description", tool.description},
        {"inputSchema", tool.input_schema},
        {"server", tool.server}
    };
}

std::string tool_result_text(const nlohmann::json& result) {
    if (result.is_object() && result.contains("content") && result["content"].is_array()) {
        std::string text;
        for (const auto& block : result["content"]) {
            if (!block.is_object() || block.value("type", "") != "text") continue;
            if (!block.contains("text") || !block["text"].is_string()) continue;
            if (!text.empty()) text += "\n";
            text += block["text"].get<std::string>();
        }
        if (!text.empty()) return text;
    }
    return result.dump();
}

bool tool_result_is_error(const nlohmann::json& result) {
    return result.is_object() && result.contains("isError") &&
           result["isError"].is_boolean() && result["isError"].get<bool>();
}

} // namespace toolhost
