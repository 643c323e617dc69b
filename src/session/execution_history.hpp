#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "protocol/tool_contract.hpp"

namespace bridge::session {

inline constexpr const char* kDefaultConversation = "default";

// Per-conversation record of tool executions. Each conversation keeps at
// most `capacity` records; the oldest one is evicted first.
class ExecutionHistory {
public:
    explicit ExecutionHistory(std::size_t capacity = 100);

    void record(const std::string& conversation_id, protocol::ExecutionRecord record);

    std::vector<protocol::ExecutionRecord> get(const std::string& conversation_id) const;

    // Records of every conversation, conversations in first-seen order.
    std::vector<protocol::ExecutionRecord> all() const;

    // Drops one conversation, or everything when no id is given.
    void clear(const std::optional<std::string>& conversation_id = std::nullopt);

    std::size_t conversation_count() const;
    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::vector<std::string> conversation_order_;
    std::unordered_map<std::string, std::deque<protocol::ExecutionRecord>> records_;
};

}  // namespace bridge::session
