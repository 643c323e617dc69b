#include "core/config/bridge_config.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <type_traits>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace bridge::core::config {

using errors::BridgeError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

BridgeError config_error(const std::string& message, const std::string& code,
                         const std::string& hint = "") {
    return BridgeError{ErrorCategory::Input, message, code, hint};
}

errors::Result<std::uint32_t> parse_u32(const std::string& text,
                                        const std::string& name) {
    std::uint32_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return config_error("Invalid number for " + name + ": " + text,
                            "config_invalid_integer",
                            "Provide a non-negative integer.");
    }
    return value;
}

errors::Result<RestartMode> parse_restart_mode(const std::string& text) {
    if (text == "fail_hard") {
        return RestartMode::FailHard;
    }
    if (text == "restart") {
        return RestartMode::Restart;
    }
    return config_error("Unknown restart mode: " + text, "config_invalid_restart_mode",
                        "Use \"fail_hard\" or \"restart\".");
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

// Copies `doc[key]` into `out` when present; a wrong JSON type is an error.
template <typename T>
errors::Status read_field(const json& doc, const char* key, T& out) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return errors::ok();
    }
    if constexpr (std::is_unsigned_v<T>) {
        if (!it->is_number_unsigned()) {
            return config_error(std::string("Config field '") + key +
                                    "' must be a non-negative integer",
                                "config_invalid_type");
        }
        if (it->get<std::uint64_t>() > std::numeric_limits<T>::max()) {
            return config_error(std::string("Config field '") + key + "' is out of range",
                                "config_invalid_type");
        }
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        return config_error(std::string("Config field '") + key +
                                "' has the wrong type: " + e.what(),
                            "config_invalid_type");
    }
    return errors::ok();
}

}  // namespace

errors::Result<BridgeConfig> load_config_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return config_error("Unable to open config file: " + path.string(),
                            "config_open_failed");
    }

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        return config_error("Config file is not valid JSON: " + std::string(e.what()),
                            "config_parse_failed");
    }
    if (!doc.is_object()) {
        return config_error("Config file must contain a JSON object.",
                            "config_parse_failed");
    }

    BridgeConfig config;
    std::string working_directory;
    std::vector<errors::Status> reads = {
        read_field(doc, "server_command", config.server_command),
        read_field(doc, "server_args", config.server_args),
        read_field(doc, "working_directory", working_directory),
        read_field(doc, "startup_grace_ms", config.startup_grace_ms),
        read_field(doc, "request_timeout_ms", config.request_timeout_ms),
        read_field(doc, "protocol_version", config.protocol_version),
        read_field(doc, "client_name", config.client_name),
        read_field(doc, "client_version", config.client_version),
        read_field(doc, "history_capacity", config.history_capacity),
        read_field(doc, "log_level", config.log_level)};
    for (const auto& status : reads) {
        if (errors::is_error(status)) {
            return errors::get_error(status);
        }
    }
    if (!working_directory.empty()) {
        config.working_directory = working_directory;
    }

    auto policy = doc.find("restart_policy");
    if (policy != doc.end() && policy->is_object()) {
        std::string mode = to_string(config.restart_policy.mode);
        std::vector<errors::Status> policy_reads = {
            read_field(*policy, "mode", mode),
            read_field(*policy, "max_restarts", config.restart_policy.max_restarts),
            read_field(*policy, "backoff_ms", config.restart_policy.backoff_ms)};
        for (const auto& status : policy_reads) {
            if (errors::is_error(status)) {
                return errors::get_error(status);
            }
        }
        auto parsed_mode = parse_restart_mode(mode);
        if (errors::is_error(parsed_mode)) {
            return errors::get_error(parsed_mode);
        }
        config.restart_policy.mode = errors::get_value(parsed_mode);
    }

    LOG_DEBUG("Loaded config from " + path.string());
    return config;
}

errors::Result<BridgeConfig> apply_env_overrides(BridgeConfig config) {
    if (const char* command = std::getenv("OFFICE_BRIDGE_SERVER_COMMAND")) {
        config.server_command = command;
    }
    if (const char* args = std::getenv("OFFICE_BRIDGE_SERVER_ARGS")) {
        config.server_args = split_words(args);
    }
    if (const char* level = std::getenv("OFFICE_BRIDGE_LOG_LEVEL")) {
        config.log_level = level;
    }
    if (const char* timeout = std::getenv("OFFICE_BRIDGE_REQUEST_TIMEOUT_MS")) {
        auto parsed = parse_u32(timeout, "OFFICE_BRIDGE_REQUEST_TIMEOUT_MS");
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.request_timeout_ms = errors::get_value(parsed);
    }
    return config;
}

errors::Status validate_config(const BridgeConfig& config) {
    if (config.server_command.empty()) {
        return config_error("No MCP server command configured.", "config_missing_command",
                            "Set server_command or pass --server.");
    }
    if (config.request_timeout_ms == 0) {
        return config_error("request_timeout_ms must be greater than zero.",
                            "config_invalid_timeout");
    }
    if (config.history_capacity == 0) {
        return config_error("history_capacity must be greater than zero.",
                            "config_invalid_history_capacity");
    }
    if (!logging::parse_log_level(config.log_level).has_value()) {
        return config_error("Unknown log level: " + config.log_level,
                            "config_invalid_log_level",
                            "Use debug, info, warn or error.");
    }
    return errors::ok();
}

std::string to_string(const RestartMode mode) {
    switch (mode) {
        case RestartMode::FailHard:
            return "fail_hard";
        case RestartMode::Restart:
            return "restart";
        default:
            return "unknown";
    }
}

}  // namespace bridge::core::config
