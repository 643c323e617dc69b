#include "runtime/tool_execution_engine.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <exception>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"

namespace bridge::runtime {

using nlohmann::json;
using protocol::ExecutionContext;
using protocol::ExecutionRecord;
using protocol::ToolCall;
using protocol::ToolExecutionResult;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch())
            .count());
}

double elapsed_ms(const std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() -
                                                     started)
        .count();
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::vector<std::string> split_words(const std::string& text) {
    std::istringstream in(text);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string joined;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += parts[i];
    }
    return joined;
}

// +10 when the name contains the query, +1 for every (query word,
// description word) pair where the description word contains the query word.
int relevance(const std::string& query, const protocol::ToolDescriptor& tool) {
    const std::string needle = lowercase(query);
    int score = 0;
    if (lowercase(tool.name).find(needle) != std::string::npos) {
        score += 10;
    }

    const auto description_words = split_words(lowercase(tool.description));
    for (const auto& query_word : split_words(needle)) {
        for (const auto& description_word : description_words) {
            if (description_word.find(query_word) != std::string::npos) {
                score += 1;
            }
        }
    }
    return score;
}

json example_value(const json& property) {
    if (property.is_object() && property.contains("example")) {
        return property["example"];
    }
    const std::string type =
        property.is_object() && property.contains("type") && property["type"].is_string()
            ? property["type"].get<std::string>()
            : std::string();
    if (type == "string") return "example_string";
    if (type == "number" || type == "integer") return 42;
    if (type == "boolean") return true;
    if (type == "array") return json::array();
    if (type == "object") return json::object();
    return nullptr;
}

}  // namespace

ToolExecutionEngine::ToolExecutionEngine(tools::ToolInvoker& invoker,
                                         tools::ToolSchemaConverter& converter,
                                         const std::size_t history_capacity)
    : invoker_(invoker), converter_(converter), history_(history_capacity) {
    LOG_INFO("Tool execution engine ready");
}

ToolExecutionResult ToolExecutionEngine::execute_tool(const std::string& tool_name,
                                                      const json& args,
                                                      const ExecutionContext& context) {
    auto call = begin(tool_name, args, context);
    return finish(call);
}

std::vector<ToolExecutionResult> ToolExecutionEngine::execute_tools(
    const std::vector<ToolCall>& calls, const ExecutionContext& context) {
    std::vector<ToolExecutionResult> results;
    results.reserve(calls.size());
    for (const auto& call : calls) {
        results.push_back(execute_tool(call.name, call.arguments, context));
        if (!results.back().success) {
            LOG_WARN("Tool " + call.name + " failed, continuing with the remaining tools: " +
                     results.back().error);
        }
    }
    return results;
}

std::vector<ToolExecutionResult> ToolExecutionEngine::execute_tools_parallel(
    const std::vector<ToolCall>& calls, const ExecutionContext& context) {
    std::vector<InFlight> in_flight;
    in_flight.reserve(calls.size());
    for (const auto& call : calls) {
        in_flight.push_back(begin(call.name, call.arguments, context));
    }

    std::vector<ToolExecutionResult> results;
    results.reserve(in_flight.size());
    for (auto& call : in_flight) {
        results.push_back(finish(call));
    }
    return results;
}

ToolExecutionEngine::InFlight ToolExecutionEngine::begin(const std::string& tool_name,
                                                         const json& args,
                                                         const ExecutionContext& context) {
    InFlight call;
    call.tool_name = tool_name;
    call.arguments = args;
    call.conversation_id = context.conversation_id.empty()
                               ? std::string(session::kDefaultConversation)
                               : context.conversation_id;
    call.started = std::chrono::steady_clock::now();

    if (!converter_.get_converted_function(tool_name).has_value()) {
        call.early_error = "Tool " + tool_name + " does not exist";
        return call;
    }

    const auto validation = converter_.validate(tool_name, args);
    if (!validation.valid) {
        call.early_error = "Argument validation failed: " + join(validation.errors, ", ");
        return call;
    }

    try {
        LOG_INFO("Executing tool " + tool_name + " (conversation " + call.conversation_id +
                 ") args=" + args.dump(-1, ' ', false, json::error_handler_t::replace));
        call.response = invoker_.call_tool_async(tool_name, args);
    } catch (const json::exception& e) {
        call.response.reset();
        call.early_error = std::string("Tool call could not be sent: ") + e.what();
    }
    return call;
}

ToolExecutionResult ToolExecutionEngine::finish(InFlight& call) {
    ToolExecutionResult result;
    result.tool_name = call.tool_name;

    if (call.response.has_value()) {
        try {
            auto settled = call.response->get();
            if (core::errors::is_error(settled)) {
                result.success = false;
                result.error = core::errors::get_error(settled).message;
            } else {
                result.success = true;
                result.result = core::errors::take_value(settled);
            }
        } catch (const std::exception& e) {
            result.success = false;
            result.error = std::string("Tool call did not complete: ") + e.what();
        }
    } else {
        result.success = false;
        result.error = call.early_error;
    }
    result.execution_time_ms = elapsed_ms(call.started);

    ExecutionRecord record;
    record.tool_name = call.tool_name;
    record.arguments = call.arguments;
    record.success = result.success;
    record.result = result.result;
    record.error = result.error;
    record.duration_ms = result.execution_time_ms;
    record.timestamp_unix_ms = now_unix_ms();
    history_.record(call.conversation_id, std::move(record));

    if (result.success) {
        LOG_INFO("Tool " + call.tool_name + " succeeded in " +
                 std::to_string(static_cast<long long>(result.execution_time_ms)) +
                 " ms, result size " +
                 std::to_string(
                     result.result.dump(-1, ' ', false, json::error_handler_t::replace).size()));
    } else {
        LOG_ERROR("Tool " + call.tool_name + " failed after " +
                  std::to_string(static_cast<long long>(result.execution_time_ms)) +
                  " ms: " + result.error);
    }
    return result;
}

std::vector<ToolSummary> ToolExecutionEngine::get_available_tools() const {
    std::vector<ToolSummary> summaries;
    for (const auto& tool : converter_.get_all_converted_functions()) {
        summaries.push_back(ToolSummary{tool.original.name, tool.original.description,
                                        tools::tool_category(tool.original.name)});
    }
    return summaries;
}

std::vector<ToolSearchHit> ToolExecutionEngine::search_tools(const std::string& query) const {
    std::vector<ToolSearchHit> hits;
    for (const auto& tool : converter_.search_tools(query)) {
        hits.push_back(ToolSearchHit{tool.original.name, tool.original.description,
                                     relevance(query, tool.original)});
    }
    std::stable_sort(hits.begin(), hits.end(),
                     [](const ToolSearchHit& a, const ToolSearchHit& b) {
                         return a.relevance > b.relevance;
                     });
    return hits;
}

std::optional<ToolDetails> ToolExecutionEngine::get_tool_details(
    const std::string& tool_name) const {
    const auto converted = converter_.get_converted_function(tool_name);
    if (!converted.has_value()) {
        return std::nullopt;
    }

    const auto& tool = converted->original;
    ToolDetails details;
    details.name = tool.name;
    details.description = tool.description;
    details.parameters = protocol::to_json(tool.input_schema);

    json example = json::object();
    if (tool.input_schema.properties.is_object()) {
        for (const auto& [key, property] : tool.input_schema.properties.items()) {
            example[key] = example_value(property);
        }
    }
    details.examples.push_back(
        json{{"description", "Basic usage example"}, {"parameters", example}});
    return details;
}

std::vector<ExecutionRecord> ToolExecutionEngine::get_execution_history(
    const std::string& conversation_id) const {
    return history_.get(conversation_id);
}

ExecutionStats ToolExecutionEngine::get_execution_stats(
    const std::optional<std::string>& conversation_id, const std::size_t top_n) const {
    const auto records = conversation_id.has_value() ? history_.get(conversation_id.value())
                                                     : history_.all();

    ExecutionStats stats;
    stats.total_executions = records.size();
    double total_time_ms = 0.0;
    std::vector<ToolUsage> usage;
    for (const auto& record : records) {
        if (record.success) {
            ++stats.successful_executions;
        }
        total_time_ms += record.duration_ms;

        auto it = std::find_if(usage.begin(), usage.end(), [&record](const ToolUsage& u) {
            return u.name == record.tool_name;
        });
        if (it == usage.end()) {
            usage.push_back(ToolUsage{record.tool_name, 1});
        } else {
            ++it->count;
        }
    }
    stats.failed_executions = stats.total_executions - stats.successful_executions;
    if (stats.total_executions > 0) {
        stats.average_execution_time_ms =
            std::round(total_time_ms / static_cast<double>(stats.total_executions));
    }

    std::stable_sort(usage.begin(), usage.end(), [](const ToolUsage& a, const ToolUsage& b) {
        return a.count > b.count;
    });
    if (usage.size() > top_n) {
        usage.resize(top_n);
    }
    stats.most_used_tools = std::move(usage);
    return stats;
}

void ToolExecutionEngine::clear_execution_history(
    const std::optional<std::string>& conversation_id) {
    history_.clear(conversation_id);
}

}  // namespace bridge::runtime
