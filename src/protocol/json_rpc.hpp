#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace bridge::protocol {

    inline constexpr const char* kJsonRpcVersion = "2.0";

    // Client -> child. `params` is omitted from the wire when empty.
    struct JsonRpcRequest {
        std::int64_t id = 0;
        std::string method;
        std::optional<nlohmann::json> params;
    };

    struct JsonRpcError {
        int code = 0;
        std::string message;
        nlohmann::json data;  // null when absent
    };

    // Child -> client. Exactly one of `result` / `error` is set.
    struct JsonRpcResponse {
        nlohmann::json id;
        std::optional<nlohmann::json> result;
        std::optional<JsonRpcError> error;
    };

    // Either direction, carries no id and expects no answer.
    struct JsonRpcNotification {
        std::string method;
        nlohmann::json params;
    };

    enum class MessageKind {
        Response,
        Notification,
        ServerRequest,  // has both id and method; we do not serve these
        Invalid
    };

    inline MessageKind classify(const nlohmann::json& message) {
        if (!message.is_object()) {
            return MessageKind::Invalid;
        }
        const bool has_id = message.contains("id") && !message["id"].is_null();
        const bool has_method = message.contains("method") && message["method"].is_string();
        if (has_id && has_method) {
            return MessageKind::ServerRequest;
        }
        if (has_id) {
            return MessageKind::Response;
        }
        if (has_method) {
            return MessageKind::Notification;
        }
        return MessageKind::Invalid;
    }

    inline nlohmann::json to_json(const JsonRpcRequest& request) {
        nlohmann::json out;
        out["jsonrpc"] = kJsonRpcVersion;
        out["id"] = request.id;
        out["method"] = request.method;
        if (request.params.has_value()) {
            out["params"] = request.params.value();
        }
        return out;
    }

    inline nlohmann::json to_json(const JsonRpcNotification& notification) {
        nlohmann::json out;
        out["jsonrpc"] = kJsonRpcVersion;
        out["method"] = notification.method;
        if (!notification.params.is_null()) {
            out["params"] = notification.params;
        }
        return out;
    }

    // Reads a response object; anything that is not shaped like one yields
    // std::nullopt. An error member wins over a result member, and an error
    // member that is not an object is reported as a malformed error.
    inline std::optional<JsonRpcResponse> parse_response(const nlohmann::json& message) {
        if (classify(message) != MessageKind::Response) {
            return std::nullopt;
        }

        JsonRpcResponse response;
        response.id = message["id"];

        auto error = message.find("error");
        if (error != message.end() && error->is_object()) {
            JsonRpcError rpc_error;
            auto code = error->find("code");
            if (code != error->end() && code->is_number_integer()) {
                rpc_error.code = code->get<int>();
            }
            auto text = error->find("message");
            if (text != error->end() && text->is_string()) {
                rpc_error.message = text->get<std::string>();
            } else {
                rpc_error.message = "Unknown MCP error";
            }
            auto data = error->find("data");
            if (data != error->end()) {
                rpc_error.data = *data;
            }
            response.error = rpc_error;
            return response;
        }
        if (error != message.end() && !error->is_null()) {
            JsonRpcError rpc_error;
            rpc_error.message = "Malformed MCP error response: " +
                                error->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            rpc_error.data = *error;
            response.error = rpc_error;
            return response;
        }

        auto result = message.find("result");
        response.result = result != message.end() ? *result : nlohmann::json(nullptr);
        return response;
    }

    // Numeric correlation id of a response, if it carries one we could have issued.
    inline std::optional<std::int64_t> numeric_id(const nlohmann::json& id) {
        if (id.is_number_integer()) {
            return id.get<std::int64_t>();
        }
        return std::nullopt;
    }

} // namespace bridge::protocol
