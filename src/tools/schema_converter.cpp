#include "tools/schema_converter.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>
#include "core/logging/logger.hpp"

namespace bridge::tools {

using nlohmann::json;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

json schema_body(const protocol::InputSchema& schema) {
    return json{{"type", "object"},
                {"properties", schema.properties.is_object() ? schema.properties
                                                             : json::object()},
                {"required", schema.required}};
}

// Unknown or missing declared types accept any value.
bool matches_type(const json& value, const json& property) {
    if (!property.is_object()) {
        return true;
    }
    auto type = property.find("type");
    if (type == property.end() || !type->is_string()) {
        return true;
    }

    const auto& declared = type->get_ref<const std::string&>();
    if (declared == "string") {
        return value.is_string();
    }
    if (declared == "number") {
        return value.is_number();
    }
    if (declared == "integer") {
        return value.is_number_integer() ||
               (value.is_number_float() && std::floor(value.get<double>()) == value.get<double>());
    }
    if (declared == "boolean") {
        return value.is_boolean();
    }
    if (declared == "array") {
        return value.is_array();
    }
    if (declared == "object") {
        return value.is_object();
    }
    return true;
}

bool name_selected(const std::string& name,
                   const std::optional<std::vector<std::string>>& tool_names) {
    if (!tool_names.has_value()) {
        return true;
    }
    return std::find(tool_names->begin(), tool_names->end(), name) != tool_names->end();
}

}  // namespace

std::string tool_category(const std::string& tool_name) {
    return tool_name.substr(0, tool_name.find('_'));
}

ConvertedTool ToolSchemaConverter::convert(const protocol::ToolDescriptor& descriptor) {
    ConvertedTool converted;
    converted.openai_form = json{{"name", descriptor.name},
                                 {"description", descriptor.description},
                                 {"parameters", schema_body(descriptor.input_schema)}};
    converted.claude_form = json{{"name", descriptor.name},
                                 {"description", descriptor.description},
                                 {"input_schema", schema_body(descriptor.input_schema)}};
    converted.original = descriptor;
    return converted;
}

ConvertedTool ToolSchemaConverter::convert_tool(const protocol::ToolDescriptor& descriptor) {
    ConvertedTool converted = convert(descriptor);

    std::lock_guard<std::mutex> lock(mutex_);
    const bool inserted = converted_.insert_or_assign(descriptor.name, converted).second;
    if (inserted) {
        order_.push_back(descriptor.name);
    }
    return converted;
}

std::vector<ConvertedTool> ToolSchemaConverter::convert_tools(
    const std::vector<protocol::ToolDescriptor>& descriptors) {
    std::vector<ConvertedTool> converted;
    converted.reserve(descriptors.size());
    for (const auto& descriptor : descriptors) {
        converted.push_back(convert_tool(descriptor));
    }
    LOG_INFO("Converted " + std::to_string(converted.size()) + " MCP tools to LLM functions");
    return converted;
}

std::optional<ConvertedTool> ToolSchemaConverter::get_converted_function(
    const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = converted_.find(name);
    if (it == converted_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ConvertedTool> ToolSchemaConverter::get_all_converted_functions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ConvertedTool> all;
    all.reserve(order_.size());
    for (const auto& name : order_) {
        all.push_back(converted_.at(name));
    }
    return all;
}

std::vector<json> ToolSchemaConverter::get_openai_functions(
    const std::optional<std::vector<std::string>>& tool_names) const {
    std::vector<json> functions;
    for (const auto& tool : get_all_converted_functions()) {
        if (name_selected(tool.original.name, tool_names)) {
            functions.push_back(tool.openai_form);
        }
    }
    return functions;
}

std::vector<json> ToolSchemaConverter::get_claude_tools(
    const std::optional<std::vector<std::string>>& tool_names) const {
    std::vector<json> tools;
    for (const auto& tool : get_all_converted_functions()) {
        if (name_selected(tool.original.name, tool_names)) {
            tools.push_back(tool.claude_form);
        }
    }
    return tools;
}

std::vector<ConvertedTool> ToolSchemaConverter::get_tools_by_category(
    const std::string& category) const {
    std::vector<ConvertedTool> matches;
    for (auto& tool : get_all_converted_functions()) {
        if (tool.original.name.rfind(category, 0) == 0) {
            matches.push_back(std::move(tool));
        }
    }
    return matches;
}

std::vector<ConvertedTool> ToolSchemaConverter::search_tools(const std::string& query) const {
    const std::string needle = lowercase(query);
    std::vector<ConvertedTool> matches;
    for (auto& tool : get_all_converted_functions()) {
        if (lowercase(tool.original.name).find(needle) != std::string::npos ||
            lowercase(tool.original.description).find(needle) != std::string::npos) {
            matches.push_back(std::move(tool));
        }
    }
    return matches;
}

ValidationResult ToolSchemaConverter::validate(const std::string& name,
                                               const json& args) const {
    const auto converted = get_converted_function(name);
    if (!converted.has_value()) {
        return ValidationResult{false, {"Tool not found: " + name}};
    }

    ValidationResult result;
    const json empty = json::object();
    const json& provided = args.is_null() ? empty : args;
    if (!provided.is_object()) {
        return ValidationResult{false, {"Arguments must be a JSON object"}};
    }

    const auto& schema = converted->original.input_schema;
    for (const auto& field : schema.required) {
        if (!provided.contains(field)) {
            result.errors.push_back("Missing required parameter: " + field);
        }
    }

    for (const auto& [key, value] : provided.items()) {
        if (!schema.properties.is_object() || !schema.properties.contains(key)) {
            result.errors.push_back("Unknown parameter: " + key);
            continue;
        }
        const auto& property = schema.properties[key];
        if (!matches_type(value, property)) {
            result.errors.push_back("Parameter " + key + " has the wrong type, expected: " +
                                    property.value("type", std::string("any")));
        }
    }

    result.valid = result.errors.empty();
    return result;
}

ConverterStats ToolSchemaConverter::stats() const {
    ConverterStats stats;
    for (const auto& tool : get_all_converted_functions()) {
        ++stats.total_functions;
        ++stats.categories[tool_category(tool.original.name)];
    }
    return stats;
}

std::size_t ToolSchemaConverter::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return converted_.size();
}

void ToolSchemaConverter::clear() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        converted_.clear();
        order_.clear();
    }
    LOG_INFO("Cleared MCP function conversion cache");
}

}  // namespace bridge::tools
