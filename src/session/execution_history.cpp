#include "session/execution_history.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace bridge::session {

ExecutionHistory::ExecutionHistory(const std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void ExecutionHistory::record(const std::string& conversation_id,
                              protocol::ExecutionRecord record) {
    const std::string key = conversation_id.empty() ? std::string(kDefaultConversation)
                                                    : conversation_id;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) {
        conversation_order_.push_back(key);
        it = records_.emplace(key, std::deque<protocol::ExecutionRecord>{}).first;
    }

    auto& ring = it->second;
    ring.push_back(std::move(record));
    while (ring.size() > capacity_) {
        ring.pop_front();
    }
}

std::vector<protocol::ExecutionRecord> ExecutionHistory::get(
    const std::string& conversation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(conversation_id);
    if (it == records_.end()) {
        return {};
    }
    return {it->second.begin(), it->second.end()};
}

std::vector<protocol::ExecutionRecord> ExecutionHistory::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<protocol::ExecutionRecord> merged;
    for (const auto& conversation : conversation_order_) {
        const auto& ring = records_.at(conversation);
        merged.insert(merged.end(), ring.begin(), ring.end());
    }
    return merged;
}

void ExecutionHistory::clear(const std::optional<std::string>& conversation_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (conversation_id.has_value()) {
            records_.erase(conversation_id.value());
            conversation_order_.erase(std::remove(conversation_order_.begin(),
                                                  conversation_order_.end(),
                                                  conversation_id.value()),
                                      conversation_order_.end());
        } else {
            records_.clear();
            conversation_order_.clear();
        }
    }
    LOG_INFO("Cleared tool execution history" +
             (conversation_id.has_value() ? " for conversation " + conversation_id.value()
                                          : std::string()));
}

std::size_t ExecutionHistory::conversation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

}  // namespace bridge::session
