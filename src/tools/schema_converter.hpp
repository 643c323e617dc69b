#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/tool_contract.hpp"

namespace bridge::tools {

// One tool in both LLM function-calling dialects.
struct ConvertedTool {
    nlohmann::json openai_form;  // {name, description, parameters}
    nlohmann::json claude_form;  // {name, description, input_schema}
    protocol::ToolDescriptor original;
};

struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
};

struct ConverterStats {
    std::size_t total_functions = 0;
    std::map<std::string, std::size_t> categories;
};

// Category of a tool is the part of its name before the first '_'.
std::string tool_category(const std::string& tool_name);

// Translates canonical tool descriptors into LLM tool definitions and keeps
// them cached by name, in the order they were first converted.
class ToolSchemaConverter {
public:
    // Pure: the same descriptor always yields the same output.
    static ConvertedTool convert(const protocol::ToolDescriptor& descriptor);

    ConvertedTool convert_tool(const protocol::ToolDescriptor& descriptor);
    std::vector<ConvertedTool> convert_tools(
        const std::vector<protocol::ToolDescriptor>& descriptors);

    std::optional<ConvertedTool> get_converted_function(const std::string& name) const;
    std::vector<ConvertedTool> get_all_converted_functions() const;

    std::vector<nlohmann::json> get_openai_functions(
        const std::optional<std::vector<std::string>>& tool_names = std::nullopt) const;
    std::vector<nlohmann::json> get_claude_tools(
        const std::optional<std::vector<std::string>>& tool_names = std::nullopt) const;

    std::vector<ConvertedTool> get_tools_by_category(const std::string& category) const;

    // Case-insensitive substring match on name or description.
    std::vector<ConvertedTool> search_tools(const std::string& query) const;

    // Checks required fields, unknown parameters and primitive types. Every
    // problem found is reported; nothing here touches the MCP process.
    ValidationResult validate(const std::string& name, const nlohmann::json& args) const;

    ConverterStats stats() const;
    std::size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, ConvertedTool> converted_;
};

}  // namespace bridge::tools
