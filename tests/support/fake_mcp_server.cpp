// Minimal MCP tool provider used by the integration tests. Speaks
// newline-delimited JSON-RPC on stdin/stdout.
//
// Flags:
//   --no-init        never answer initialize
//   --exit-on-start  exit with code 5 before reading anything
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <poll.h>
#include <string>
#include <unistd.h>
#include <vector>
#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;
using Clock = std::chrono::steady_clock;

struct Deferred {
    Clock::time_point due;
    json message;
};

void send(const json& message) {
    std::cout << message.dump() << "\n" << std::flush;
}

json text_content(const std::string& text) {
    return json{{"content", json::array({json{{"type", "text"}, {"text", text}}})}};
}

json tool(const std::string& name, const std::string& description, json properties,
          std::vector<std::string> required) {
    return json{{"name", name},
                {"description", description},
                {"inputSchema",
                 {{"type", "object"}, {"properties", properties}, {"required", required}}}};
}

json tool_list() {
    return json::array({
        tool("echo", "Echo a message back", {{"msg", {{"type", "string"}}}}, {"msg"}),
        tool("add", "Add two numbers", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}},
             {"a", "b"}),
        tool("slow", "Answer after a delay", {{"delay_ms", {{"type", "number"}}}, {"tag", {{"type", "string"}}}},
             {"delay_ms"}),
        tool("never", "Never answers", json::object(), {}),
        tool("fail", "Always fails", json::object(), {}),
        tool("garbage", "Writes a malformed line before answering", json::object(), {}),
        tool("crash", "Exits the server", json::object(), {}),
        tool("get_server_info", "Describe this server", json::object(), {}),
    });
}

json result(const json& id, json payload) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(payload)}};
}

json error(const json& id, int code, const std::string& message) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

void handle_call(const json& id, const json& params, std::vector<Deferred>& deferred) {
    const std::string name = params.value("name", "");
    const json args = params.value("arguments", json::object());

    if (name == "echo") {
        send(result(id, text_content(args.value("msg", ""))));
    } else if (name == "add") {
        const double sum = args.value("a", 0.0) + args.value("b", 0.0);
        json payload = text_content(std::to_string(sum));
        payload["structuredContent"] = {{"sum", sum}};
        send(result(id, payload));
    } else if (name == "slow") {
        const auto delay = std::chrono::milliseconds(args.value("delay_ms", 0));
        deferred.push_back(Deferred{Clock::now() + delay,
                                    result(id, text_content(args.value("tag", "slow")))});
    } else if (name == "never") {
        // Intentionally silent.
    } else if (name == "fail") {
        send(error(id, -32000, "tool failed on purpose"));
    } else if (name == "garbage") {
        std::cout << "{this is not json\n" << std::flush;
        send(result(id, text_content("after garbage")));
    } else if (name == "crash") {
        std::cerr << "fake server crashing on request" << std::endl;
        std::exit(3);
    } else if (name == "get_server_info") {
        json payload = text_content("fake-mcp");
        payload["structuredContent"] = {{"name", "fake-mcp"}, {"version", "0.1.0"}};
        send(result(id, payload));
    } else {
        send(error(id, -32602, "Unknown tool: " + name));
    }
}

void handle_line(const std::string& line, bool answer_initialize,
                 std::vector<Deferred>& deferred) {
    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error&) {
        std::cerr << "fake server got malformed input" << std::endl;
        return;
    }
    if (!message.contains("id")) {
        return;  // notification
    }

    const json id = message["id"];
    const std::string method = message.value("method", "");
    if (method == "initialize") {
        if (!answer_initialize) {
            return;
        }
        send(result(id, {{"protocolVersion", message["params"].value("protocolVersion", "")},
                         {"capabilities", {{"tools", json::object()}}},
                         {"serverInfo", {{"name", "fake-mcp"}, {"version", "0.1.0"}}},
                         {"echoedClientInfo", message["params"]["clientInfo"]}}));
        send(json{{"jsonrpc", "2.0"},
                  {"method", "notifications/message"},
                  {"params", {{"level", "info"}, {"data", "ready"}}}});
    } else if (method == "tools/list") {
        send(result(id, {{"tools", tool_list()}}));
    } else if (method == "tools/call") {
        handle_call(id, message.value("params", json::object()), deferred);
    } else {
        send(error(id, -32601, "Method not found: " + method));
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    bool answer_initialize = true;
    for (int i = 1; i < argc; ++i) {
        const std::string flag = argv[i];
        if (flag == "--no-init") {
            answer_initialize = false;
        } else if (flag == "--exit-on-start") {
            return 5;
        }
    }
    std::cerr << "fake server booted" << std::endl;

    std::vector<Deferred> deferred;
    std::string buffer;
    char chunk[4096];
    while (true) {
        int timeout_ms = -1;
        if (!deferred.empty()) {
            auto earliest = deferred.front().due;
            for (const auto& d : deferred) {
                earliest = std::min(earliest, d.due);
            }
            const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
                earliest - Clock::now());
            timeout_ms = wait.count() > 0 ? static_cast<int>(wait.count()) : 0;
        }

        pollfd fd{STDIN_FILENO, POLLIN, 0};
        const int ready = poll(&fd, 1, timeout_ms);
        if (ready > 0) {
            const ssize_t n = read(STDIN_FILENO, chunk, sizeof(chunk));
            if (n <= 0) {
                return 0;
            }
            buffer.append(chunk, static_cast<std::size_t>(n));
            std::size_t newline;
            while ((newline = buffer.find('\n')) != std::string::npos) {
                const std::string line = buffer.substr(0, newline);
                buffer.erase(0, newline + 1);
                if (!line.empty()) {
                    handle_line(line, answer_initialize, deferred);
                }
            }
        }

        const auto now = Clock::now();
        for (auto it = deferred.begin(); it != deferred.end();) {
            if (it->due <= now) {
                send(it->message);
                it = deferred.erase(it);
            } else {
                ++it;
            }
        }
    }
}
