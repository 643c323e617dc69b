#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/tool_contract.hpp"
#include "rpc/request_correlator.hpp"
#include "session/execution_history.hpp"
#include "tools/schema_converter.hpp"
#include "tools/tool_invoker.hpp"

namespace bridge::runtime {

struct ToolUsage {
    std::string name;
    std::size_t count = 0;
};

struct ExecutionStats {
    std::size_t total_executions = 0;
    std::size_t successful_executions = 0;
    std::size_t failed_executions = 0;
    double average_execution_time_ms = 0.0;  // rounded to whole milliseconds
    std::vector<ToolUsage> most_used_tools;
};

struct ToolSearchHit {
    std::string name;
    std::string description;
    int relevance = 0;
};

struct ToolSummary {
    std::string name;
    std::string description;
    std::string category;
};

struct ToolDetails {
    std::string name;
    std::string description;
    nlohmann::json parameters;
    nlohmann::json examples = nlohmann::json::array();
};

// Facade the HTTP and conversation layers use to run tools. Every call is
// validated locally before it reaches the MCP process, and every outcome,
// good or bad, comes back as a ToolExecutionResult and is kept in history.
class ToolExecutionEngine {
public:
    ToolExecutionEngine(tools::ToolInvoker& invoker, tools::ToolSchemaConverter& converter,
                        std::size_t history_capacity = 100);

    protocol::ToolExecutionResult execute_tool(
        const std::string& tool_name, const nlohmann::json& args,
        const protocol::ExecutionContext& context = {});

    // One after another; a failed call does not stop the batch.
    std::vector<protocol::ToolExecutionResult> execute_tools(
        const std::vector<protocol::ToolCall>& calls,
        const protocol::ExecutionContext& context = {});

    // All calls are in flight at once; results keep the order of `calls`.
    std::vector<protocol::ToolExecutionResult> execute_tools_parallel(
        const std::vector<protocol::ToolCall>& calls,
        const protocol::ExecutionContext& context = {});

    std::vector<ToolSummary> get_available_tools() const;
    std::vector<ToolSearchHit> search_tools(const std::string& query) const;
    std::optional<ToolDetails> get_tool_details(const std::string& tool_name) const;

    std::vector<protocol::ExecutionRecord> get_execution_history(
        const std::string& conversation_id = session::kDefaultConversation) const;
    ExecutionStats get_execution_stats(
        const std::optional<std::string>& conversation_id = std::nullopt,
        std::size_t top_n = 10) const;
    void clear_execution_history(
        const std::optional<std::string>& conversation_id = std::nullopt);

private:
    struct InFlight {
        std::string tool_name;
        nlohmann::json arguments;
        std::string conversation_id;
        std::chrono::steady_clock::time_point started;
        std::optional<rpc::ResponseFuture> response;
        std::string early_error;
    };

    InFlight begin(const std::string& tool_name, const nlohmann::json& args,
                   const protocol::ExecutionContext& context);
    protocol::ToolExecutionResult finish(InFlight& call);

    tools::ToolInvoker& invoker_;
    tools::ToolSchemaConverter& converter_;
    session::ExecutionHistory history_;
};

}  // namespace bridge::runtime
