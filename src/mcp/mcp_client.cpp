#include "mcp/mcp_client.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>
#include "core/logging/logger.hpp"

namespace bridge::mcp {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

rpc::ResponseFuture settled(core::errors::Result<json> value) {
    std::promise<core::errors::Result<json>> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

BridgeError not_initialized() {
    return BridgeError{ErrorCategory::NotInitialized, "MCP server not initialized",
                       "not_initialized", "Call start() and wait for it to succeed."};
}

}  // namespace

McpClient::McpClient(core::config::BridgeConfig config) : config_(std::move(config)) {
    correlator_ = std::make_unique<rpc::RequestCorrelator>(
        [this](const std::string& line) -> core::errors::Status {
            auto written = supervisor_->write(line);
            if (core::errors::is_error(written)) {
                fail_fatally(core::errors::get_error(written));
            }
            return written;
        },
        std::chrono::milliseconds(config_.request_timeout_ms));

    decoder_ = std::make_unique<protocol::FrameDecoder>(
        [this](const json& message) { correlator_->handle_message(message); });

    supervisor_ = std::make_unique<transport::ProcessSupervisor>(
        [this](std::string_view chunk) { decoder_->feed(chunk); },
        [this](const int exit_code) { handle_process_exit(exit_code); });
}

McpClient::~McpClient() {
    stop();
}

core::errors::Status McpClient::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (initialized_) {
        LOG_WARN("MCP server process is already running");
        return core::errors::ok();
    }
    crashed_ = false;
    return start_locked();
}

core::errors::Status McpClient::start_locked() {
    supervisor_->stop();
    decoder_->reset();

    transport::ProcessSpec spec;
    spec.command = config_.server_command;
    spec.args = config_.server_args;
    spec.working_directory = config_.working_directory;

    LOG_INFO("Starting MCP server: " + spec.command);
    auto spawned = supervisor_->start(spec);
    if (core::errors::is_error(spawned)) {
        auto error = core::errors::get_error(spawned);
        error.category = ErrorCategory::Startup;
        LOG_ERROR("Failed to start MCP server [" + error.code + "]: " + error.message);
        return error;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(config_.startup_grace_ms));
    if (!supervisor_->running()) {
        supervisor_->stop();
        return BridgeError{ErrorCategory::Startup,
                           "MCP server exited during startup.", "spawn_failed",
                           "Check the server's stderr output in the log."};
    }

    json params = {{"protocolVersion", config_.protocol_version},
                   {"capabilities", json::object()},
                   {"clientInfo",
                    {{"name", config_.client_name}, {"version", config_.client_version}}}};
    auto handshake = correlator_->issue("initialize", std::move(params)).get();
    if (core::errors::is_error(handshake)) {
        const auto& cause = core::errors::get_error(handshake);
        LOG_ERROR("MCP initialize handshake failed: " + cause.message);
        supervisor_->stop();
        return BridgeError{ErrorCategory::Startup,
                           "MCP initialize handshake failed: " + cause.message,
                           "handshake_failed"};
    }

    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        server_info_ = core::errors::get_value(handshake);
    }
    initialized_ = true;
    crashed_ = false;

    auto notified = correlator_->notify("notifications/initialized");
    if (core::errors::is_error(notified)) {
        supervisor_->stop();
        return BridgeError{ErrorCategory::Startup,
                           "MCP server went away right after initialize: " +
                               core::errors::get_error(notified).message,
                           "handshake_failed"};
    }

    LOG_INFO("MCP server initialized: " + server_info().dump());
    return core::errors::ok();
}

void McpClient::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    const bool was_initialized = initialized_.exchange(false);
    if (was_initialized) {
        LOG_INFO("Stopping MCP server");
    }
    supervisor_->stop();
    crashed_ = false;
    correlator_->reject_all(
        BridgeError{ErrorCategory::ProcessExit, "MCP server stopped", "process_exited"});
    decoder_->reset();
}

core::errors::Status McpClient::ensure_ready() {
    if (initialized_) {
        return core::errors::ok();
    }

    const auto& policy = config_.restart_policy;
    if (!crashed_ || policy.mode != core::config::RestartMode::Restart) {
        return not_initialized();
    }

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (initialized_) {
        return core::errors::ok();
    }
    if (!crashed_) {
        return not_initialized();
    }
    const std::uint32_t attempt = restarts_.load();
    if (attempt >= policy.max_restarts) {
        LOG_ERROR("MCP server restart budget exhausted (" +
                  std::to_string(policy.max_restarts) + " restarts)");
        return not_initialized();
    }

    const auto backoff = std::chrono::milliseconds(
        static_cast<std::uint64_t>(policy.backoff_ms) << std::min<std::uint32_t>(attempt, 16));
    LOG_WARN("Restarting MCP server (attempt " + std::to_string(attempt + 1) + " of " +
             std::to_string(policy.max_restarts) + ") after " +
             std::to_string(backoff.count()) + " ms");
    std::this_thread::sleep_for(backoff);
    ++restarts_;

    auto restarted = start_locked();
    if (core::errors::is_error(restarted)) {
        return restarted;
    }
    return core::errors::ok();
}

rpc::ResponseFuture McpClient::request(const std::string& method,
                                       std::optional<json> params) {
    if (method == "initialize") {
        if (!supervisor_->running()) {
            return settled(not_initialized());
        }
        return correlator_->issue(method, std::move(params));
    }

    auto ready = ensure_ready();
    if (core::errors::is_error(ready)) {
        return settled(core::errors::get_error(ready));
    }
    return correlator_->issue(method, std::move(params));
}

core::errors::Result<json> McpClient::call(const std::string& method,
                                           std::optional<json> params) {
    return request(method, std::move(params)).get();
}

core::errors::Result<std::vector<protocol::ToolDescriptor>> McpClient::list_tools() {
    auto listed = call("tools/list");
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }

    const auto& result = core::errors::get_value(listed);
    std::vector<protocol::ToolDescriptor> tools;
    if (!result.is_object() || !result.contains("tools")) {
        return tools;
    }
    if (!result["tools"].is_array()) {
        return BridgeError{ErrorCategory::Internal,
                           "tools/list returned a non-array tools member",
                           "invalid_response"};
    }

    for (const auto& entry : result["tools"]) {
        auto parsed = protocol::parse_tool_descriptor(entry);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        tools.push_back(core::errors::take_value(parsed));
    }
    LOG_INFO("MCP server offers " + std::to_string(tools.size()) + " tools");
    return tools;
}

core::errors::Result<json> McpClient::call_tool(const std::string& name,
                                                const json& arguments) {
    return call_tool_async(name, arguments).get();
}

rpc::ResponseFuture McpClient::call_tool_async(const std::string& name,
                                               const json& arguments) {
    return request("tools/call", json{{"name", name}, {"arguments", arguments}});
}

core::errors::Result<json> McpClient::get_server_info() {
    auto called = call_tool("get_server_info", json::object());
    if (core::errors::is_error(called)) {
        return called;
    }
    const auto& result = core::errors::get_value(called);
    if (result.is_object() && result.contains("structuredContent")) {
        return result["structuredContent"];
    }
    return result;
}

json McpClient::server_info() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return server_info_;
}

void McpClient::set_notification_handler(
    rpc::RequestCorrelator::NotificationHandler handler) {
    correlator_->set_notification_handler(std::move(handler));
}

std::size_t McpClient::pending_requests() const {
    return correlator_->pending_count();
}

void McpClient::handle_process_exit(const int exit_code) {
    fail_fatally(BridgeError{ErrorCategory::ProcessExit,
                             "MCP server process exited (code " +
                                 std::to_string(exit_code) + ")",
                             "process_exited"});
}

void McpClient::fail_fatally(const BridgeError& error) {
    initialized_ = false;
    crashed_ = true;
    const auto failed = correlator_->reject_all(error);
    LOG_ERROR("MCP connection lost [" + error.code + "]: " + error.message + "; failed " +
              std::to_string(failed) + " pending requests");
}

}  // namespace bridge::mcp
