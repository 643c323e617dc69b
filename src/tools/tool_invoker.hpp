#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "rpc/request_correlator.hpp"

namespace bridge::tools {

// Anything that can run a named tool and eventually answer. McpClient is the
// production implementation; tests substitute their own.
class ToolInvoker {
public:
    virtual ~ToolInvoker() = default;

    virtual rpc::ResponseFuture call_tool_async(const std::string& name,
                                                const nlohmann::json& arguments) = 0;
};

}  // namespace bridge::tools
