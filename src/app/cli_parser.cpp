#include "cli_parser.hpp"
#include <optional>
#include <system_error>
#include <vector>

namespace bridge::app::cli {

    using namespace bridge::core::errors;
    using bridge::core::config::BridgeConfig;

    namespace {
        constexpr const char* kUsage =
            "Usage: office_bridge <list-tools|call TOOL|search QUERY|details TOOL> "
            "[--config FILE] [--server CMD] [--arg ARG]... [--args JSON] "
            "[--conversation ID] [--verbose]";

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> target;
            std::optional<std::string> config;
            std::optional<std::string> server;
            std::vector<std::string> server_args;
            std::optional<std::string> args_json;
            std::optional<std::string> conversation;
            bool verbose = false;
        };

        std::optional<CliCommand> parse_command(const std::string& text) {
            if (text == "list-tools") return CliCommand::ListTools;
            if (text == "call") return CliCommand::Call;
            if (text == "search") return CliCommand::Search;
            if (text == "details") return CliCommand::Details;
            return std::nullopt;
        }
    }

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return BridgeError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        const std::string command_text = argv[1];
        const auto command = parse_command(command_text);
        if (!command.has_value()) {
            return BridgeError{ErrorCategory::Input, "Unknown command: " + command_text, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            const bool has_value = i + 1 < args.size();
            if (flag == "--config") {
                if (has_value) raw.config = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (flag == "--server") {
                if (has_value) raw.server = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --server", "missing_value"};
            } else if (flag == "--arg") {
                if (has_value) raw.server_args.push_back(args[++i]);
                else return BridgeError{ErrorCategory::Input, "Missing value for --arg", "missing_value"};
            } else if (flag == "--args") {
                if (has_value) raw.args_json = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --args", "missing_value"};
            } else if (flag == "--conversation") {
                if (has_value) raw.conversation = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --conversation", "missing_value"};
            } else if (flag == "--verbose") {
                raw.verbose = true;
            } else if (flag.rfind("--", 0) == 0) {
                return BridgeError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            } else if (!raw.target.has_value()) {
                raw.target = flag;
            } else {
                return BridgeError{ErrorCategory::Input, "Unexpected positional argument: " + flag, "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CliOptions options;
        options.command = command.value();
        options.verbose = raw.verbose;
        options.server_args = raw.server_args;
        if (raw.conversation) options.conversation_id = raw.conversation.value();
        if (raw.server) options.server_command = raw.server.value();
        if (raw.config) options.config_file = std::filesystem::path(raw.config.value());

        const bool needs_target = options.command != CliCommand::ListTools;
        if (needs_target && !raw.target.has_value()) {
            return BridgeError{ErrorCategory::Input, "Command '" + command_text + "' needs an argument", "missing_target", kUsage};
        }
        if (!needs_target && raw.target.has_value()) {
            return BridgeError{ErrorCategory::Input, "list-tools takes no positional argument", "unknown_argument"};
        }
        if (raw.target) options.target = raw.target.value();

        if (raw.args_json) {
            if (options.command != CliCommand::Call) {
                return BridgeError{ErrorCategory::Input, "--args is only valid with 'call'", "conflicting_flags"};
            }
            try {
                options.arguments = nlohmann::json::parse(raw.args_json.value());
            } catch (const nlohmann::json::parse_error& e) {
                return BridgeError{ErrorCategory::Input, std::string("--args is not valid JSON: ") + e.what(), "invalid_json"};
            }
            if (!options.arguments.is_object()) {
                return BridgeError{ErrorCategory::Input, "--args must be a JSON object", "invalid_json", "Example: --args '{\"text\":\"hello\"}'"};
            }
        }

        if (options.config_file) {
            std::error_code ec;
            const bool exists = std::filesystem::is_regular_file(options.config_file.value(), ec);
            if (ec || !exists) {
                return BridgeError{ErrorCategory::Input, "Config file does not exist: " + options.config_file->string(), "invalid_path"};
            }
        }

        return options;
    }

    Result<BridgeConfig> build_config(const CliOptions& options) {
        BridgeConfig config;
        if (options.config_file) {
            auto loaded = bridge::core::config::load_config_file(options.config_file.value());
            if (is_error(loaded)) {
                return get_error(loaded);
            }
            config = get_value(loaded);
        }

        auto overridden = bridge::core::config::apply_env_overrides(config);
        if (is_error(overridden)) {
            return get_error(overridden);
        }
        config = get_value(overridden);

        if (options.server_command) {
            config.server_command = options.server_command.value();
            config.server_args = options.server_args;
        } else if (!options.server_args.empty()) {
            config.server_args = options.server_args;
        }
        if (options.verbose) {
            config.log_level = "debug";
        }

        auto valid = bridge::core::config::validate_config(config);
        if (is_error(valid)) {
            return get_error(valid);
        }
        return config;
    }

} // namespace bridge::app::cli
