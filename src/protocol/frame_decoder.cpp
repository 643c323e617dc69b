#include "protocol/frame_decoder.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace bridge::protocol {

namespace {

std::string_view trim(std::string_view text) {
    const auto is_space = [](const char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

std::string preview(std::string_view line) {
    constexpr std::size_t kMaxPreview = 200;
    if (line.size() <= kMaxPreview) {
        return std::string(line);
    }
    return std::string(line.substr(0, kMaxPreview)) + "...";
}

}  // namespace

FrameDecoder::FrameDecoder(MessageHandler on_message, const std::size_t max_line_bytes)
    : on_message_(std::move(on_message)), max_line_bytes_(max_line_bytes) {}

std::size_t FrameDecoder::feed(std::string_view chunk) {
    if (discarding_) {
        const auto newline = chunk.find('\n');
        if (newline == std::string_view::npos) {
            return 0;
        }
        chunk.remove_prefix(newline + 1);
        discarding_ = false;
    }
    buffer_.append(chunk.data(), chunk.size());

    std::size_t dispatched = 0;
    std::size_t line_start = 0;
    while (true) {
        const auto newline = buffer_.find('\n', line_start);
        if (newline == std::string::npos) {
            break;
        }
        const std::string_view line(buffer_.data() + line_start, newline - line_start);
        if (line.size() > max_line_bytes_) {
            drop_oversized(line.size());
        } else if (dispatch_line(line)) {
            ++dispatched;
        }
        line_start = newline + 1;
    }

    buffer_.erase(0, line_start);
    if (buffer_.size() > max_line_bytes_) {
        drop_oversized(buffer_.size());
        buffer_.clear();
        discarding_ = true;
    }
    return dispatched;
}

void FrameDecoder::reset() {
    buffer_.clear();
    discarding_ = false;
}

void FrameDecoder::drop_oversized(const std::size_t line_bytes) {
    ++dropped_lines_;
    LOG_ERROR("FrameDecoder: dropping MCP message longer than " +
              std::to_string(max_line_bytes_) + " bytes (" + std::to_string(line_bytes) +
              " bytes so far)");
}

bool FrameDecoder::dispatch_line(std::string_view line) {
    const auto trimmed = trim(line);
    if (trimmed.empty()) {
        return false;
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(trimmed.begin(), trimmed.end());
    } catch (const nlohmann::json::parse_error& e) {
        ++dropped_lines_;
        LOG_ERROR("FrameDecoder: dropping malformed MCP message: " + preview(trimmed) +
                  " (" + e.what() + ")");
        return false;
    }

    if (on_message_) {
        on_message_(message);
    }
    return true;
}

}  // namespace bridge::protocol
