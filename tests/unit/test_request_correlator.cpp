#include <algorithm>
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "rpc/request_correlator.hpp"

namespace {

using bridge::core::errors::BridgeError;
using bridge::core::errors::ErrorCategory;
using bridge::core::errors::get_error;
using bridge::core::errors::get_value;
using bridge::core::errors::is_error;
using bridge::core::errors::Status;
using bridge::rpc::RequestCorrelator;
using bridge::rpc::ResponseFuture;
using nlohmann::json;

// Stands in for the child's stdin: records every line written.
class LineSink {
public:
    Status write(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(line);
        return bridge::core::errors::ok();
    }

    std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

json response(std::int64_t id, json result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

bool is_ready(ResponseFuture& future) {
    return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

TEST(RequestCorrelatorTest, WritesNewlineTerminatedRequests) {
    LineSink sink;
    RequestCorrelator correlator([&sink](const std::string& line) { return sink.write(line); },
                                 std::chrono::seconds(30));

    auto first = correlator.issue("tools/list");
    auto second = correlator.issue("tools/call", json{{"name", "echo"}, {"arguments", {}}});

    const auto lines = sink.lines();
    ASSERT_EQ(lines.size(), 2u);
    for (const auto& line : lines) {
        ASSERT_FALSE(line.empty());
        EXPECT_EQ(line.back(), '\n');
        EXPECT_EQ(std::count(line.begin(), line.end(), '\n'), 1);
    }

    const auto list = json::parse(lines[0]);
    EXPECT_EQ(list["jsonrpc"], "2.0");
    EXPECT_EQ(list["id"], 1);
    EXPECT_EQ(list["method"], "tools/list");
    EXPECT_FALSE(list.contains("params"));

    const auto call = json::parse(lines[1]);
    EXPECT_EQ(call["id"], 2);
    EXPECT_EQ(call["params"]["name"], "echo");
    EXPECT_EQ(correlator.pending_count(), 2u);
    EXPECT_EQ(correlator.last_issued_id(), 2);
}

TEST(RequestCorrelatorTest, ResolvesResponsesInAnyOrder) {
    LineSink sink;
    RequestCorrelator correlator([&sink](const std::string& line) { return sink.write(line); },
                                 std::chrono::seconds(30));

    std::vector<ResponseFuture> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(correlator.issue("tools/call", json{{"n", i}}));
    }

    for (const std::int64_t id : {3, 1, 5, 2, 4}) {
        correlator.handle_message(response(id, json{{"value", id * 10}}));
    }

    for (std::size_t i = 0; i < futures.size(); ++i) {
        ASSERT_TRUE(is_ready(futures[i]));
        auto settled = futures[i].get();
        ASSERT_FALSE(is_error(settled));
        EXPECT_EQ(get_value(settled)["value"], static_cast<int>((i + 1) * 10));
    }
    EXPECT_EQ(correlator.pending_count(), 0u);
}

TEST(RequestCorrelatorTest, RemoteErrorRejectsWithCodeAndMessage) {
    LineSink sink;
    RequestCorrelator correlator([&sink](const std::string& line) { return sink.write(line); },
                                 std::chrono::seconds(30));

    auto future = correlator.issue("tools/call");
    correlator.handle_message(json{
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"error", {{"code", -32602}, {"message", "bad params"}, {"data", {{"field", "msg"}}}}}});

    ASSERT_TRUE(is_ready(future));
    auto settled = future.get();
    ASSERT_TRUE(is_error(settled));
    const auto& error = get_error(settled);
    EXPECT_EQ(error.category, ErrorCategory::RemoteTool);
    EXPECT_EQ(error.message, "bad params");
    ASSERT_TRUE(error.rpc_code.has_value());
    EXPECT_EQ(error.rpc_code.value(), -32602);
    EXPECT_EQ(error.data["field"], "msg");
}

TEST(RequestCorrelatorTest, NonObjectErrorMemberRejectsRequest) {
    LineSink sink;
    RequestCorrelator correlator([&sink](const std::string& line) { return sink.write(line); },
                                 std::chrono::seconds(30));
    auto future = correlator.issue("tools/call");

    correlator.handle_message(json{{"jsonrpc", "2.0"}, {"id", 1}, {"error", "boom"}});

    ASSERT_TRUE(is_ready(future));
    auto settled = future.get();
    ASSERT_TRUE(is_error(settled));
    EXPECT_EQ(get_error(settled).category, ErrorCategory::RemoteTool);
    EXPECT_NE(get_error(settled).message.find("boom"), std::string::npos);
}

TEST(RequestCorrelatorTest, NullErrorMemberIsTreatedAsSuccess) {
    LineSink sink;
    RequestCorrelator correlator([&sink](const std::string& line) { return sink.write(line); },
                                 std::chrono::seconds(30));
    auto future = correlator.issue("tools/list");

    correlator.handle_message(
        json{{"jsonrpc", "2.0"}, {"id", 1}, {"error", nullptr}, {"result", "fine"}});

    ASSERT_TRUE(is_ready(future));
    EXPECT_EQ(get_value(future.get()), "fine");
}

TEST(RequestCorrelatorTest, UnencodableParamsAreRejectedWithoutLeavingAnEntry) {
    LineSink sink;
    RequestCorrelator correlator([&sink](const std::string& line) { return sink.write(line); },
                                 std::chrono::seconds(30));

    auto future = correlator.issue(
        "tools/call", json{{"name", "echo"}, {"arguments", {{"msg", std::string("caf\xe9")}}}});

    ASSERT_TRUE(is_ready(future));
    auto settled = future.get();
    ASSERT_TRUE(is_error(settled));
    EXPECT_EQ(get_error(settled).category, ErrorCategory::Internal);
    EXPECT_EQ(get_error(settled).code, "invalid_request");
    EXPECT_EQ(correlator.pending_count(), 0u);
    EXPECT_EQ(correlator.last_issued_id(), 0);
    EXPECT_TRUE(sink.lines().empty());

    auto next = correlator.issue("tools/list");
    EXPECT_EQ(correlator.last_issued_id(), 1);
    EXPECT_EQ(json::parse(sink.lines().at(0))["id"], 1);
    EXPECT_TRUE(is_error(correlator.notify("notifications/message",
                                           json{{"data", std::string("\xc3")}})));
    EXPECT_EQ(sink.lines().size(), 1u);
}

TEST(RequestCorrelatorTest, ResponseForUnknownIdIsNoOp) {
    LineSink sink;
    RequestCorrelator correlator([&sink](const std::string& line) { return sink.write(line); },
                                 std::chrono::seconds(30));
    auto future = correlator.issue("tools/list");

    EXPECT_NO_THROW(correlator.handle_message(response(99, "stray")));
    EXPECT_NO_THROW(correlator.handle_message(response(0, "stray")));
    EXPECT_EQ(correlator.pending_count(), 1u);
    EXPECT_FALSE(is_ready(future));

    correlator.handle_message(response(1, "mine"));
    ASSERT_TRUE(is_ready(future));
    EXPECT_EQ(get_value(future.get()), "mine");
}

TEST(RequestCorrelatorTest, StringIdDoesNotMatchNumericRequest) {
    LineSink sink;
    RequestCorrelator correlator([&sink](const std::string& line) { return sink.write(line); },
                                 std::chrono::seconds(30));
    auto future = correlator.issue("tools/list");

    correlator.handle_message(json{{"jsonrpc", "2.0"}, {"id", "1"}, {"result", 1}});
    EXPECT_FALSE(is_ready(future));
    EXPECT_EQ(correlator.pending_count(), 1u);
}

TEST(RequestCorrelatorTest, DuplicateResponseDoesNotResolveTwice) {
    LineSink sink;
    RequestCorrelator correlator([&sink](const std::string& line) { return sink.write(line); },
                                 std::chrono::seconds(30));
    auto future = correlator.issue("tools/list");

    correlator.handle_message(response(1, "first"));
    EXPECT_NO_THROW(correlator.handle_message(response(1, "second")));

    ASSERT_TRUE(is_ready(future));
    EXPECT_EQ(get_value(future.get()), "first");
}

TEST(RequestCorrelatorTest, TimeoutRejectsOnceAndLateResponseIsIgnored) {
    LineSink sink;
    RequestCorrelator correlator([&sink](const std::string& line) { return sink.write(line); },
                                 std::chrono::milliseconds(100));
    auto future = correlator.issue("tools/call");

    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto settled = future.get();
    ASSERT_TRUE(is_error(settled));
    EXPECT_EQ(get_error(settled).category, ErrorCategory::Timeout);
    EXPECT_EQ(get_error(settled).code, "request_timeout");
    EXPECT_NE(get_error(settled).message.find("tools/call"), std::string::npos);
    EXPECT_EQ(correlator.pending_count(), 0u);

    EXPECT_NO_THROW(correlator.handle_message(response(1, "too late")));
    EXPECT_EQ(correlator.pending_count(), 0u);
}

TEST(RequestCorrelatorTest, TimeoutOnlyAffectsTheExpiredRequest) {
    LineSink sink;
    RequestCorrelator correlator([&sink](const std::string& line) { return sink.write(line); },
                                 std::chrono::milliseconds(150));
    auto slow = correlator.issue("tools/call", json{{"name", "slow"}});
    auto fast = correlator.issue("tools/call", json{{"name", "fast"}});

    correlator.handle_message(response(2, "fast result"));
    ASSERT_TRUE(is_ready(fast));
    auto fast_result = fast.get();
    ASSERT_FALSE(is_error(fast_result));
    EXPECT_EQ(get_value(fast_result), "fast result");

    ASSERT_EQ(slow.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto slow_result = slow.get();
    ASSERT_TRUE(is_error(slow_result));
    EXPECT_EQ(get_error(slow_result).category, ErrorCategory::Timeout);
}

TEST(RequestCorrelatorTest, RejectAllFailsEveryPendingRequestExactlyOnce) {
    LineSink sink;
    RequestCorrelator correlator([&sink](const std::string& line) { return sink.write(line); },
                                 std::chrono::seconds(30));
    std::vector<ResponseFuture> futures;
    for (int i = 0; i < 3; ++i) {
        futures.push_back(correlator.issue("tools/call"));
    }

    const BridgeError exited{ErrorCategory::ProcessExit, "MCP server process exited (code 1)",
                             "process_exited"};
    EXPECT_EQ(correlator.reject_all(exited), 3u);
    EXPECT_EQ(correlator.reject_all(exited), 0u);

    for (auto& future : futures) {
        ASSERT_TRUE(is_ready(future));
        auto settled = future.get();
        ASSERT_TRUE(is_error(settled));
        EXPECT_EQ(get_error(settled).category, ErrorCategory::ProcessExit);
    }
    EXPECT_NO_THROW(correlator.handle_message(response(2, "after exit")));
}

TEST(RequestCorrelatorTest, NotificationsBypassThePendingMap) {
    LineSink sink;
    RequestCorrelator correlator([&sink](const std::string& line) { return sink.write(line); },
                                 std::chrono::seconds(30));
    std::vector<std::string> seen;
    correlator.set_notification_handler(
        [&seen](const bridge::protocol::JsonRpcNotification& notification) {
            seen.push_back(notification.method + ":" + notification.params.dump());
        });

    auto future = correlator.issue("tools/list");
    correlator.handle_message(json{{"jsonrpc", "2.0"},
                                   {"method", "notifications/progress"},
                                   {"params", {{"progress", 50}}}});

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "notifications/progress:{\"progress\":50}");
    EXPECT_EQ(correlator.pending_count(), 1u);
    EXPECT_FALSE(is_ready(future));
}

TEST(RequestCorrelatorTest, NotifyWritesMessageWithoutId) {
    LineSink sink;
    RequestCorrelator correlator([&sink](const std::string& line) { return sink.write(line); },
                                 std::chrono::seconds(30));

    EXPECT_FALSE(is_error(correlator.notify("notifications/initialized")));
    const auto lines = sink.lines();
    ASSERT_EQ(lines.size(), 1u);
    const auto message = json::parse(lines[0]);
    EXPECT_FALSE(message.contains("id"));
    EXPECT_EQ(message["method"], "notifications/initialized");
    EXPECT_EQ(correlator.pending_count(), 0u);
    EXPECT_EQ(correlator.last_issued_id(), 0);
}

TEST(RequestCorrelatorTest, WriteFailureSettlesTheRequestImmediately) {
    RequestCorrelator correlator(
        [](const std::string&) -> Status {
            return BridgeError{ErrorCategory::ProcessExit, "Broken pipe", "stdin_write_failed"};
        },
        std::chrono::seconds(30));

    auto future = correlator.issue("tools/list");
    ASSERT_TRUE(is_ready(future));
    auto settled = future.get();
    ASSERT_TRUE(is_error(settled));
    EXPECT_EQ(get_error(settled).code, "stdin_write_failed");
    EXPECT_EQ(correlator.pending_count(), 0u);
}

TEST(RequestCorrelatorTest, ConcurrentIssuersReceiveUniqueIncreasingIds) {
    LineSink sink;
    RequestCorrelator correlator([&sink](const std::string& line) { return sink.write(line); },
                                 std::chrono::seconds(30));

    std::vector<std::thread> threads;
    std::mutex futures_mutex;
    std::vector<ResponseFuture> futures;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 25; ++i) {
                auto future = correlator.issue("tools/call");
                std::lock_guard<std::mutex> lock(futures_mutex);
                futures.push_back(std::move(future));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<std::int64_t> ids;
    for (const auto& line : sink.lines()) {
        ids.insert(json::parse(line)["id"].get<std::int64_t>());
    }
    EXPECT_EQ(ids.size(), 100u);
    EXPECT_EQ(*ids.begin(), 1);
    EXPECT_EQ(*ids.rbegin(), 100);
    EXPECT_EQ(correlator.pending_count(), 100u);
}

}  // namespace
