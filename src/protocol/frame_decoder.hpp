#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace bridge::protocol {

// Splits a newline-delimited JSON byte stream into messages. A message is
// only dispatched once its terminating '\n' has been seen; the trailing
// partial line is kept for the next chunk.
class FrameDecoder {
public:
    using MessageHandler = std::function<void(const nlohmann::json&)>;

    static constexpr std::size_t kDefaultMaxLineBytes = 64 * 1024 * 1024;

    // A line growing past `max_line_bytes` is dropped up to its newline.
    explicit FrameDecoder(MessageHandler on_message,
                          std::size_t max_line_bytes = kDefaultMaxLineBytes);

    // Returns the number of messages dispatched from this chunk.
    std::size_t feed(std::string_view chunk);

    void reset();

    std::size_t dropped_lines() const { return dropped_lines_; }
    std::size_t buffered_bytes() const { return buffer_.size(); }

private:
    bool dispatch_line(std::string_view line);
    void drop_oversized(std::size_t line_bytes);

    MessageHandler on_message_;
    const std::size_t max_line_bytes_;
    std::string buffer_;
    bool discarding_ = false;
    std::size_t dropped_lines_ = 0;
};

}  // namespace bridge::protocol
