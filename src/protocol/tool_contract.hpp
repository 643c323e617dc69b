#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace bridge::protocol {

    // Parameter schema of one tool as listed by the child.
    struct InputSchema {
        nlohmann::json properties = nlohmann::json::object();
        std::vector<std::string> required;
    };

    struct ToolDescriptor {
        std::string name;
        std::string description;
        InputSchema input_schema;
    };

    // How an LLM asks for a tool to run
    struct ToolCall {
        std::string name;
        nlohmann::json arguments = nlohmann::json::object();
    };

    struct ExecutionContext {
        std::string conversation_id;  // empty -> "default" bucket
        std::string user_id;
        std::string session_id;
    };

    // What the engine hands back for every call, successful or not.
    struct ToolExecutionResult {
        bool success = false;
        nlohmann::json result;
        std::string error;
        double execution_time_ms = 0.0;
        std::string tool_name;
    };

    struct ExecutionRecord {
        std::string tool_name;
        nlohmann::json arguments;
        bool success = false;
        nlohmann::json result;
        std::string error;
        double duration_ms = 0.0;
        std::int64_t timestamp_unix_ms = 0;
    };

    inline nlohmann::json to_json(const InputSchema& schema) {
        return nlohmann::json{{"type", "object"},
                              {"properties", schema.properties},
                              {"required", schema.required}};
    }

    inline nlohmann::json to_json(const ToolDescriptor& tool) {
        return nlohmann::json{{"name", tool.name},
                              {"description", tool.description},
                              {"inputSchema", to_json(tool.input_schema)}};
    }

    // Wire shape consumed by the HTTP layer.
    inline nlohmann::json to_json(const ToolExecutionResult& result) {
        nlohmann::json out;
        out["success"] = result.success;
        if (result.success) {
            out["result"] = result.result;
        } else {
            out["error"] = result.error;
        }
        out["executionTime"] = result.execution_time_ms;
        out["toolName"] = result.tool_name;
        return out;
    }

    inline nlohmann::json to_json(const ExecutionRecord& record) {
        nlohmann::json out;
        out["toolName"] = record.tool_name;
        out["arguments"] = record.arguments;
        out["success"] = record.success;
        if (record.success) {
            out["result"] = record.result;
        } else {
            out["error"] = record.error;
        }
        out["duration"] = record.duration_ms;
        out["timestamp"] = record.timestamp_unix_ms;
        return out;
    }

    // Reads one entry of a tools/list result. A missing `required` list or
    // `properties` object means the tool takes no mandatory parameters.
    inline core::errors::Result<ToolDescriptor> parse_tool_descriptor(const nlohmann::json& tool) {
        using core::errors::BridgeError;
        using core::errors::ErrorCategory;

        if (!tool.is_object() || !tool.contains("name") || !tool["name"].is_string()) {
            return BridgeError{ErrorCategory::Internal, "Tool entry has no name: " + tool.dump(),
                               "invalid_response"};
        }

        ToolDescriptor descriptor;
        descriptor.name = tool["name"].get<std::string>();
        auto description = tool.find("description");
        if (description != tool.end() && description->is_string()) {
            descriptor.description = description->get<std::string>();
        }

        auto schema = tool.find("inputSchema");
        if (schema == tool.end() || !schema->is_object()) {
            return descriptor;
        }
        auto properties = schema->find("properties");
        if (properties != schema->end() && properties->is_object()) {
            descriptor.input_schema.properties = *properties;
        }
        auto required = schema->find("required");
        if (required != schema->end() && required->is_array()) {
            for (const auto& field : *required) {
                if (!field.is_string()) {
                    return BridgeError{ErrorCategory::Internal,
                                       "Tool " + descriptor.name +
                                           " lists a non-string required field",
                                       "invalid_response"};
                }
                descriptor.input_schema.required.push_back(field.get<std::string>());
            }
        }
        return descriptor;
    }

} // namespace bridge::protocol
