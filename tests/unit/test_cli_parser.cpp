#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/bridge_errors.hpp"

namespace {

using bridge::app::cli::build_config;
using bridge::app::cli::CliCommand;
using bridge::app::cli::CliOptions;
using bridge::app::cli::parse_and_validate;
using bridge::core::errors::ErrorCategory;
using bridge::core::errors::get_error;
using bridge::core::errors::get_value;
using bridge::core::errors::is_error;

bridge::core::errors::Result<CliOptions> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("office_bridge");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

void clear_bridge_env() {
    unsetenv("OFFICE_BRIDGE_SERVER_COMMAND");
    unsetenv("OFFICE_BRIDGE_SERVER_ARGS");
    unsetenv("OFFICE_BRIDGE_LOG_LEVEL");
    unsetenv("OFFICE_BRIDGE_REQUEST_TIMEOUT_MS");
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenToolNameMissing) {
    auto result = parse_tokens({"call", "--server", "server-bin"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_target");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"list-tools", "--server"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownFlag) {
    auto result = parse_tokens({"list-tools", "--turbo"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsOnExtraPositional) {
    auto result = parse_tokens({"details", "echo", "add"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, ParsesCallWithArguments) {
    auto result = parse_tokens({"call", "echo", "--server", "node", "--arg", "server.js",
                                "--arg", "--stdio", "--args", R"({"msg":"hi"})",
                                "--conversation", "conv-1", "--verbose"});
    ASSERT_FALSE(is_error(result));
    const auto& options = get_value(result);
    EXPECT_EQ(options.command, CliCommand::Call);
    EXPECT_EQ(options.target, "echo");
    EXPECT_EQ(options.arguments["msg"], "hi");
    ASSERT_TRUE(options.server_command.has_value());
    EXPECT_EQ(options.server_command.value(), "node");
    EXPECT_EQ(options.server_args, (std::vector<std::string>{"server.js", "--stdio"}));
    EXPECT_EQ(options.conversation_id, "conv-1");
    EXPECT_TRUE(options.verbose);
}

TEST(CliParserTest, ArgsAreOnlyValidWithCall) {
    auto result = parse_tokens({"search", "table", "--args", "{}"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST(CliParserTest, RejectsMalformedOrNonObjectArgs) {
    auto malformed = parse_tokens({"call", "echo", "--args", "{msg:"});
    ASSERT_TRUE(is_error(malformed));
    EXPECT_EQ(get_error(malformed).code, "invalid_json");

    auto array = parse_tokens({"call", "echo", "--args", "[1,2]"});
    ASSERT_TRUE(is_error(array));
    EXPECT_EQ(get_error(array).code, "invalid_json");
}

TEST(CliParserTest, RejectsMissingConfigFile) {
    auto result = parse_tokens({"list-tools", "--config", "/nonexistent/bridge.json"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, BuildConfigLayersFileEnvAndFlags) {
    clear_bridge_env();
    const auto path = std::filesystem::temp_directory_path() / "office_bridge_cli_test.json";
    {
        std::ofstream out(path);
        out << R"({"server_command": "from-file", "server_args": ["a"],
                   "request_timeout_ms": 1234, "log_level": "warn"})";
    }
    setenv("OFFICE_BRIDGE_REQUEST_TIMEOUT_MS", "4321", 1);

    auto parsed = parse_tokens({"list-tools", "--config", path.string(), "--server",
                                "from-flag", "--verbose"});
    ASSERT_FALSE(is_error(parsed));
    auto config = build_config(get_value(parsed));
    clear_bridge_env();
    std::filesystem::remove(path);

    ASSERT_FALSE(is_error(config));
    const auto& built = get_value(config);
    EXPECT_EQ(built.server_command, "from-flag");
    EXPECT_TRUE(built.server_args.empty());
    EXPECT_EQ(built.request_timeout_ms, 4321u);
    EXPECT_EQ(built.log_level, "debug");
}

TEST(CliParserTest, BuildConfigRequiresAServerCommand) {
    clear_bridge_env();
    auto parsed = parse_tokens({"list-tools"});
    ASSERT_FALSE(is_error(parsed));

    auto config = build_config(get_value(parsed));
    ASSERT_TRUE(is_error(config));
    EXPECT_EQ(get_error(config).code, "config_missing_command");
}

}  // namespace
