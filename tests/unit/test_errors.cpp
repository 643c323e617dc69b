#include <string>
#include <gtest/gtest.h>
#include "core/errors/bridge_errors.hpp"

using namespace bridge::core::errors;

// A dummy function to simulate a remote tool failing
Result<std::string> simulate_tool_call(bool should_fail) {
    if (should_fail) {
        BridgeError error{ErrorCategory::RemoteTool, "Document is locked", "remote_error"};
        error.rpc_code = -32000;
        return error;
    }
    return std::string("tool output");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_tool_call(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "tool output");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_tool_call(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::RemoteTool);
    EXPECT_EQ(error.message, "Document is locked");
    ASSERT_TRUE(error.rpc_code.has_value());
    EXPECT_EQ(error.rpc_code.value(), -32000);
    EXPECT_TRUE(error.data.is_null());
}

TEST(ErrorModelTest, StatusOkCarriesNoError) {
    Status status = ok();
    EXPECT_FALSE(is_error(status));
}

TEST(ErrorModelTest, CategoryNamesAreStable) {
    EXPECT_EQ(to_string(ErrorCategory::ProcessExit), "process_exit");
    EXPECT_EQ(to_string(ErrorCategory::NotInitialized), "not_initialized");
    EXPECT_EQ(to_string(ErrorCategory::Timeout), "timeout");
}
