#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "mcp/mcp_client.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/tool_execution_engine.hpp"
#include "tools/schema_converter.hpp"

namespace {

using nlohmann::json;

void report(const bridge::core::errors::BridgeError& err, const std::string& what) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

json tools_to_json(const std::vector<bridge::tools::ConvertedTool>& tools) {
    json out = json::array();
    for (const auto& tool : tools) {
        out.push_back({{"name", tool.original.name},
                       {"openai", tool.openai_form},
                       {"claude", tool.claude_form}});
    }
    return out;
}

json hits_to_json(const std::vector<bridge::runtime::ToolSearchHit>& hits) {
    json out = json::array();
    for (const auto& hit : hits) {
        out.push_back({{"name", hit.name},
                       {"description", hit.description},
                       {"relevance", hit.relevance}});
    }
    return out;
}

json details_to_json(const bridge::runtime::ToolDetails& details) {
    return json{{"name", details.name},
                {"description", details.description},
                {"parameters", details.parameters},
                {"examples", details.examples}};
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace bridge;

    auto parsed = app::cli::parse_and_validate(argc, argv);
    if (core::errors::is_error(parsed)) {
        report(core::errors::get_error(parsed), "Input error");
        return 2;
    }
    const auto& options = core::errors::get_value(parsed);

    auto configured = app::cli::build_config(options);
    if (core::errors::is_error(configured)) {
        report(core::errors::get_error(configured), "Configuration error");
        return 2;
    }
    const auto& config = core::errors::get_value(configured);

    auto level = core::logging::parse_log_level(config.log_level);
    core::logging::Logger::get().set_min_level(level.value_or(core::logging::LogLevel::INFO));
    core::logging::Logger::get().set_context(config.client_name);

    mcp::McpClient client(config);
    auto started = client.start();
    if (core::errors::is_error(started)) {
        report(core::errors::get_error(started), "Failed to start MCP server");
        return 3;
    }

    auto listed = client.list_tools();
    if (core::errors::is_error(listed)) {
        report(core::errors::get_error(listed), "Failed to list tools");
        client.stop();
        return 4;
    }

    tools::ToolSchemaConverter converter;
    converter.convert_tools(core::errors::get_value(listed));
    runtime::ToolExecutionEngine engine(client, converter, config.history_capacity);

    int exit_code = 0;
    switch (options.command) {
        case app::cli::CliCommand::ListTools:
            std::cout << tools_to_json(converter.get_all_converted_functions()).dump(2)
                      << std::endl;
            break;
        case app::cli::CliCommand::Call: {
            protocol::ExecutionContext context;
            context.conversation_id = options.conversation_id;
            const auto result = engine.execute_tool(options.target, options.arguments, context);
            std::cout << protocol::to_json(result).dump(2) << std::endl;
            exit_code = result.success ? 0 : 1;
            break;
        }
        case app::cli::CliCommand::Search:
            std::cout << hits_to_json(engine.search_tools(options.target)).dump(2) << std::endl;
            break;
        case app::cli::CliCommand::Details: {
            const auto details = engine.get_tool_details(options.target);
            if (!details.has_value()) {
                LOG_ERROR("Tool " + options.target + " does not exist");
                exit_code = 1;
                break;
            }
            std::cout << details_to_json(details.value()).dump(2) << std::endl;
            break;
        }
    }

    client.stop();
    return exit_code;
}
