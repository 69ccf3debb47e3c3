#include "protocol.hpp"

namespace toolhost {

std::optional<int64_t> ResponseMessage::numeric_id() const {
    if (id.is_number_integer()) {
        return id.get<int64_t>();
    }
    return std::nullopt;
}

static bool valid_id(const nlohmann::json& id) {
    return id.is_string() || id.is_number_integer();
}

static std::optional<Message> reject(std::string* why, const char* reason) {
    if (why) *why = reason;
    return std::nullopt;
}

std::optional<Message> classify_message(const nlohmann::json& j, std::string* why) {
    if (!j.is_object()) {
        return reject(why, "message is not a JSON object");
    }

    auto method_it = j.find("method");
    auto id_it = j.find("id");
    bool has_id = id_it != j.end() && !id_it->is_null();

    if (method_it != j.end()) {
        if (!method_it->is_string()) {
            return reject(why, "method must be a string");
        }
        nlohmann::json params = j.value("params", nlohmann::json(nullptr));
        if (has_id) {
            if (!valid_id(*id_it)) {
                return reject(why, "id must be a string or an integer");
            }
            return Message{RequestMessage{*id_it, method_it->get<std::string>(),
                                          std::move(params)}};
        }
        return Message{NotificationMessage{method_it->get<std::string>(), std::move(params)}};
    }

    if (!has_id) {
        return reject(why, "message has neither method nor id");
    }

    bool has_result = j.contains("result");
    bool has_error = j.contains("error");
    if (has_result == has_error) {
        return reject(why, "response must carry exactly one of result or error");
    }

    ResponseMessage response;
    response.id = *id_it;
    if (has_result) {
        response.result = j["result"];
    } else {
        const auto& e = j["error"];
        if (!e.is_object()) {
            return reject(why, "error must be an object");
        }
        RpcError err;
        if (e.contains("code") && e["code"].is_number_integer())
            err.code = e["code"].get<int>();
        if (e.contains("message") && e["message"].is_string())
            err.message = e["message"].get<std::string>();
        if (e.contains("data"))
            err.data = e["data"];
        response.error = std::move(err);
    }
    return Message{std::move(response)};
}

nlohmann::json make_request(int64_t id, const std::string& method,
                            const nlohmann::json& params) {
    nlohmann::json msg = {
        {"jsonrpc", protocol::kJsonRpcVersion},
        {"id", id},
        {"method", method}
    };
    if (!params.is_null()) {
        msg["params"] = params;
    }
    return msg;
}

nlohmann::json make_notification(const std::string& method, const nlohmann::json& params) {
    nlohmann::json msg = {
        {"jsonrpc", protocol::kJsonRpcVersion},
        {"method", method}
    };
    if (!params.is_null()) {
        msg["params"] = params;
    }
    return msg;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
    return {{"jsonrpc", protocol::kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, int code,
                                   const std::string& message) {
    return {{"jsonrpc", protocol::kJsonRpcVersion},
            {"id", id},
            {"error", {{"code", code}, {"message", message}}}};
}

nlohmann::json initialize_params() {
    return {
        {"protocolVersion", protocol::kProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {
            {"name", protocol::kClientName},
            {"version", protocol::kClientVersion}
        }}
    };
}

} // namespace toolhost
