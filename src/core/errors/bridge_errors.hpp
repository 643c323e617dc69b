#pragma once
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>

namespace bridge::core::errors {

    enum class ErrorCategory {
        Startup,         // Spawn or initialize handshake failed
        Decode,          // A line from the child was not valid JSON
        Timeout,         // No response before the request deadline
        RemoteTool,      // The child answered with an error object
        Validation,      // Tool arguments do not match the tool schema
        ProcessExit,     // Child died or its stdin could not be written
        NotInitialized,  // Request issued before the handshake completed
        Input,           // Bad CLI flag or config value
        Internal         // Logic bug or unexpected payload shape
    };

    struct BridgeError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
        std::optional<int> rpc_code;  // Set for RemoteTool errors
        nlohmann::json data;          // error.data from the child, if any
    };

    // A Result holds either a successful value of type T, OR a BridgeError.
    template <typename T>
    using Result = std::variant<T, BridgeError>;

    // Result of operations that produce no value.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BridgeError>(result);
    }

    template <typename T>
    const BridgeError& get_error(const Result<T>& result) {
        return std::get<BridgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>& result) {
        return std::move(std::get<T>(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Startup:
                return "startup";
            case ErrorCategory::Decode:
                return "decode";
            case ErrorCategory::Timeout:
                return "timeout";
            case ErrorCategory::RemoteTool:
                return "remote_tool";
            case ErrorCategory::Validation:
                return "validation";
            case ErrorCategory::ProcessExit:
                return "process_exit";
            case ErrorCategory::NotInitialized:
                return "not_initialized";
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

} // namespace bridge::core::errors
