#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "protocol/json_rpc.hpp"

namespace bridge::rpc {

using ResponseFuture = std::future<core::errors::Result<nlohmann::json>>;

// Matches responses decoded from the child's stdout back to the request that
// caused them, by id. Every request owns an independent deadline enforced by
// a timer thread. All members are safe to call from any thread; the pending
// map is guarded by one mutex and promises are always fulfilled outside it.
class RequestCorrelator {
public:
    using Writer = std::function<core::errors::Status(const std::string& line)>;
    using NotificationHandler =
        std::function<void(const protocol::JsonRpcNotification& notification)>;

    RequestCorrelator(Writer writer, std::chrono::milliseconds request_timeout);
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    // Allocates the next id, registers the pending entry and writes the
    // request line. A failed write settles the returned future immediately.
    ResponseFuture issue(const std::string& method,
                         std::optional<nlohmann::json> params = std::nullopt);

    core::errors::Status notify(const std::string& method,
                                nlohmann::json params = nullptr);

    // Entry point for every message the FrameDecoder produces.
    void handle_message(const nlohmann::json& message);

    // Fails every outstanding request with `error`. Returns how many were failed.
    std::size_t reject_all(const core::errors::BridgeError& error);

    void set_notification_handler(NotificationHandler handler);

    std::size_t pending_count() const;
    std::int64_t last_issued_id() const;
    std::chrono::milliseconds request_timeout() const { return request_timeout_; }

private:
    struct PendingRequest {
        std::string method;
        std::promise<core::errors::Result<nlohmann::json>> promise;
        std::chrono::steady_clock::time_point deadline;
    };

    void handle_response(const protocol::JsonRpcResponse& response);
    void handle_notification(const nlohmann::json& message);
    std::optional<PendingRequest> take_pending(std::int64_t id);
    void timer_loop();

    Writer writer_;
    const std::chrono::milliseconds request_timeout_;

    mutable std::mutex mutex_;
    std::condition_variable timer_cv_;
    std::map<std::int64_t, PendingRequest> pending_;
    std::int64_t next_id_ = 0;
    bool stopping_ = false;
    NotificationHandler notification_handler_;

    std::thread timer_thread_;
};

}  // namespace bridge::rpc
