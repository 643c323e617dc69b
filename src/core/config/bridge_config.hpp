#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace bridge::core::config {

enum class RestartMode {
    FailHard,
    Restart
};

struct RestartPolicy {
    RestartMode mode = RestartMode::FailHard;
    std::uint32_t max_restarts = 3;
    std::uint32_t backoff_ms = 500;
};

// Everything needed to launch and talk to one tool-provider process.
struct BridgeConfig {
    std::string server_command;
    std::vector<std::string> server_args;
    std::filesystem::path working_directory = std::filesystem::current_path();
    std::uint32_t startup_grace_ms = 3000;
    std::uint32_t request_timeout_ms = 30000;
    std::string protocol_version = "2024-11-05";
    std::string client_name = "office-ai-bridge";
    std::string client_version = "1.0.0";
    std::size_t history_capacity = 100;
    std::string log_level = "info";
    RestartPolicy restart_policy;
};

errors::Result<BridgeConfig> load_config_file(const std::filesystem::path& path);

// Reads OFFICE_BRIDGE_* variables from the environment on top of `config`.
errors::Result<BridgeConfig> apply_env_overrides(BridgeConfig config);

errors::Status validate_config(const BridgeConfig& config);

std::string to_string(RestartMode mode);

}  // namespace bridge::core::config
