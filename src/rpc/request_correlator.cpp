#include "rpc/request_correlator.hpp"

#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace bridge::rpc {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

core::errors::Result<json> remote_failure(const protocol::JsonRpcError& error) {
    BridgeError failure{ErrorCategory::RemoteTool, error.message, "remote_error"};
    failure.rpc_code = error.code;
    failure.data = error.data;
    return failure;
}

}  // namespace

RequestCorrelator::RequestCorrelator(Writer writer,
                                     std::chrono::milliseconds request_timeout)
    : writer_(std::move(writer)), request_timeout_(request_timeout) {
    timer_thread_ = std::thread(&RequestCorrelator::timer_loop, this);
}

RequestCorrelator::~RequestCorrelator() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    timer_cv_.notify_all();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
    reject_all(BridgeError{ErrorCategory::ProcessExit,
                           "MCP client shut down with requests in flight.",
                           "process_exited"});
}

ResponseFuture RequestCorrelator::issue(const std::string& method,
                                        std::optional<json> params) {
    protocol::JsonRpcRequest request;
    request.method = method;
    request.params = std::move(params);

    ResponseFuture future;
    std::string line;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        request.id = next_id_ + 1;
        try {
            line = protocol::to_json(request).dump() + "\n";
        } catch (const json::exception& e) {
            // Nothing was registered or sent; the id is not consumed.
            LOG_ERROR("RequestCorrelator: cannot serialize " + method + ": " + e.what());
            std::promise<core::errors::Result<json>> rejected;
            rejected.set_value(BridgeError{ErrorCategory::Internal,
                                           "Cannot serialize MCP request " + method + ": " +
                                               e.what(),
                                           "invalid_request"});
            return rejected.get_future();
        }
        next_id_ = request.id;

        PendingRequest pending;
        pending.method = method;
        pending.deadline = std::chrono::steady_clock::now() + request_timeout_;
        future = pending.promise.get_future();
        pending_.emplace(request.id, std::move(pending));
    }
    timer_cv_.notify_all();

    LOG_DEBUG("RequestCorrelator: sending #" + std::to_string(request.id) + " " + method);

    auto written = writer_(line);
    if (core::errors::is_error(written)) {
        // The writer may already have failed everything through reject_all;
        // in that case there is nothing left to settle here.
        auto entry = take_pending(request.id);
        if (entry.has_value()) {
            entry->promise.set_value(core::errors::get_error(written));
        }
    }
    return future;
}

core::errors::Status RequestCorrelator::notify(const std::string& method, json params) {
    protocol::JsonRpcNotification notification{method, std::move(params)};
    std::string line;
    try {
        line = protocol::to_json(notification).dump() + "\n";
    } catch (const json::exception& e) {
        return BridgeError{ErrorCategory::Internal,
                           "Cannot serialize MCP notification " + method + ": " + e.what(),
                           "invalid_request"};
    }
    LOG_DEBUG("RequestCorrelator: sending notification " + method);
    return writer_(line);
}

void RequestCorrelator::handle_message(const json& message) {
    switch (protocol::classify(message)) {
        case protocol::MessageKind::Response: {
            auto response = protocol::parse_response(message);
            if (response.has_value()) {
                handle_response(response.value());
            }
            return;
        }
        case protocol::MessageKind::Notification:
        case protocol::MessageKind::ServerRequest:
            handle_notification(message);
            return;
        case protocol::MessageKind::Invalid:
        default:
            LOG_WARN("RequestCorrelator: ignoring message without id or method: " +
                     message.dump(-1, ' ', false, json::error_handler_t::replace));
            return;
    }
}

void RequestCorrelator::handle_response(const protocol::JsonRpcResponse& response) {
    const auto id = protocol::numeric_id(response.id);
    std::optional<PendingRequest> entry;
    if (id.has_value()) {
        entry = take_pending(id.value());
    }
    if (!entry.has_value()) {
        LOG_DEBUG("RequestCorrelator: no pending request for id " + response.id.dump() +
                  ", ignoring response");
        return;
    }

    if (response.error.has_value()) {
        LOG_ERROR("MCP request failed: " + entry->method + ": " +
                  response.error->message);
        entry->promise.set_value(remote_failure(response.error.value()));
        return;
    }
    entry->promise.set_value(response.result.value_or(json(nullptr)));
}

void RequestCorrelator::handle_notification(const json& message) {
    protocol::JsonRpcNotification notification;
    notification.method = message.value("method", "");
    auto params = message.find("params");
    if (params != message.end()) {
        notification.params = *params;
    }
    LOG_DEBUG("RequestCorrelator: received MCP notification " + notification.method);

    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = notification_handler_;
    }
    if (handler) {
        handler(notification);
    }
}

std::size_t RequestCorrelator::reject_all(const BridgeError& error) {
    std::map<std::int64_t, PendingRequest> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(pending_);
    }
    timer_cv_.notify_all();

    for (auto& [id, pending] : drained) {
        LOG_DEBUG("RequestCorrelator: failing #" + std::to_string(id) + " " +
                  pending.method + ": " + error.message);
        pending.promise.set_value(error);
    }
    return drained.size();
}

void RequestCorrelator::set_notification_handler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handler_ = std::move(handler);
}

std::size_t RequestCorrelator::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::int64_t RequestCorrelator::last_issued_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_;
}

std::optional<RequestCorrelator::PendingRequest> RequestCorrelator::take_pending(
    const std::int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    PendingRequest entry = std::move(it->second);
    pending_.erase(it);
    return entry;
}

void RequestCorrelator::timer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (pending_.empty()) {
            timer_cv_.wait(lock);
            continue;
        }

        const auto now = std::chrono::steady_clock::now();
        auto earliest = std::chrono::steady_clock::time_point::max();
        std::vector<std::pair<std::int64_t, PendingRequest>> expired;
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.deadline <= now) {
                expired.emplace_back(it->first, std::move(it->second));
                it = pending_.erase(it);
                continue;
            }
            if (it->second.deadline < earliest) {
                earliest = it->second.deadline;
            }
            ++it;
        }

        if (!expired.empty()) {
            lock.unlock();
            for (auto& [id, pending] : expired) {
                LOG_WARN("MCP request timed out: #" + std::to_string(id) + " " +
                         pending.method);
                pending.promise.set_value(BridgeError{
                    ErrorCategory::Timeout, "MCP request timed out: " + pending.method,
                    "request_timeout"});
            }
            lock.lock();
            continue;
        }

        if (earliest != std::chrono::steady_clock::time_point::max()) {
            timer_cv_.wait_until(lock, earliest);
        }
    }
}

}  // namespace bridge::rpc
