#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"

namespace bridge::app::cli {

    enum class CliCommand {
        ListTools,
        Call,
        Search,
        Details
    };

    struct CliOptions {
        CliCommand command = CliCommand::ListTools;
        std::string target;  // tool name for call/details, query for search
        nlohmann::json arguments = nlohmann::json::object();
        std::optional<std::filesystem::path> config_file;
        std::optional<std::string> server_command;
        std::vector<std::string> server_args;
        std::string conversation_id;
        bool verbose = false;
    };

    bridge::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);

    // Config file, then environment, then command-line flags; validated.
    bridge::core::errors::Result<bridge::core::config::BridgeConfig> build_config(
        const CliOptions& options);
}
