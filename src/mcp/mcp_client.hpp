#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "protocol/frame_decoder.hpp"
#include "protocol/tool_contract.hpp"
#include "rpc/request_correlator.hpp"
#include "tools/tool_invoker.hpp"
#include "transport/process_supervisor.hpp"

namespace bridge::mcp {

// Client side of the MCP stdio protocol. Owns the tool-provider process,
// the decoder fed by its stdout and the correlator that pairs responses
// with requests. Construct one per process and hand it out by reference.
class McpClient : public tools::ToolInvoker {
public:
    explicit McpClient(core::config::BridgeConfig config);
    ~McpClient() override;

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    // Spawns the child, waits the startup grace period and performs the
    // initialize handshake. A no-op when already initialized.
    core::errors::Status start();
    void stop();

    bool initialized() const { return initialized_.load(); }

    // Everything except "initialize" fails fast until the handshake is done.
    rpc::ResponseFuture request(const std::string& method,
                                std::optional<nlohmann::json> params = std::nullopt);

    // Blocking form of request(); bounded by the request timeout.
    core::errors::Result<nlohmann::json> call(
        const std::string& method, std::optional<nlohmann::json> params = std::nullopt);

    core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools();
    core::errors::Result<nlohmann::json> call_tool(const std::string& name,
                                                   const nlohmann::json& arguments);
    rpc::ResponseFuture call_tool_async(const std::string& name,
                                        const nlohmann::json& arguments) override;

    // Runs the provider's get_server_info tool and unwraps structuredContent.
    core::errors::Result<nlohmann::json> get_server_info();

    // Result of the last successful initialize handshake.
    nlohmann::json server_info() const;

    void set_notification_handler(rpc::RequestCorrelator::NotificationHandler handler);

    std::size_t pending_requests() const;
    std::uint32_t restarts_performed() const { return restarts_.load(); }
    const core::config::BridgeConfig& config() const { return config_; }

private:
    core::errors::Status start_locked();
    core::errors::Status ensure_ready();
    void handle_process_exit(int exit_code);
    void fail_fatally(const core::errors::BridgeError& error);

    core::config::BridgeConfig config_;

    std::unique_ptr<rpc::RequestCorrelator> correlator_;
    std::unique_ptr<protocol::FrameDecoder> decoder_;
    std::unique_ptr<transport::ProcessSupervisor> supervisor_;

    std::mutex lifecycle_mutex_;
    std::atomic_bool initialized_{false};
    std::atomic_bool crashed_{false};
    std::atomic<std::uint32_t> restarts_{0};

    mutable std::mutex info_mutex_;
    nlohmann::json server_info_;
};

}  // namespace bridge::mcp
