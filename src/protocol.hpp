#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace toolhost {

namespace protocol {
    constexpr const char* kJsonRpcVersion  = "2.0";
    constexpr const char* kProtocolVersion = "2024-11-05";
    constexpr const char* kClientName      = "toolhost";
    constexpr const char* kClientVersion   = "0.3.0";

    namespace method {
        constexpr const char* Initialize       = "initialize";
        constexpr const char* Initialized      = "notifications/initialized";
        constexpr const char* ToolsList        = "tools/list";
        constexpr const char* ToolsCall        = "tools/call";
        constexpr const char* ToolsListChanged = "notifications/tools/list_changed";
        constexpr const char* Ping             = "ping";
    } // namespace method

    constexpr int kMethodNotFound = -32601;
} // namespace protocol

struct RpcError {
    int code = 0;
    std::string message;
    nlohmann::json data;
};

// {id, method, params} sent by the provider to us.
struct RequestMessage {
    nlohmann::json id;
    std::string method;
    nlohmann::json params;
};

// {id, result} or {id, error}. Exactly one of the two is set.
struct ResponseMessage {
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    // Integer id, if the id is one we could have issued.
    std::optional<int64_t> numeric_id() const;
};

// {method, params} without an id.
struct NotificationMessage {
    std::string method;
    nlohmann::json params;
};

using Message = std::variant<RequestMessage, ResponseMessage, NotificationMessage>;

// Classify a decoded JSON value. Returns nullopt and fills `why` (if given)
// when the value fits none of the three shapes.
std::optional<Message> classify_message(const nlohmann::json& j, std::string* why = nullptr);

nlohmann::json make_request(int64_t id, const std::string& method,
                            const nlohmann::json& params);
nlohmann::json make_notification(const std::string& method,
                                 const nlohmann::json& params = nullptr);
nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, int code,
                                   const std::string& message);

// Params for the initialize request.
nlohmann::json initialize_params();

} // namespace toolhost
