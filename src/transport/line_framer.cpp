#include "devflow/transport/line_framer.hpp"

#include <algorithm>
#include <cctype>

namespace devflow {

namespace {

TransportError protocol_error(std::string message) {
    return TransportError{TransportError::Category::Protocol, std::move(message), std::nullopt};
}

[[nodiscard]] bool is_blank(std::string_view line) noexcept {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

std::string encode_frame(const Json& message) {
    // dump() escapes control characters, so the payload never contains '\n'.
    std::string frame = message.dump(-1, ' ', false, Json::error_handler_t::replace);
    frame.push_back('\n');
    return frame;
}

TransportResult<Json> decode_frame(std::string_view payload) {
    Json parsed = Json::parse(payload.begin(), payload.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return tl::unexpected(protocol_error("frame is not valid JSON"));
    }
    return parsed;
}

void LineFramer::feed(std::string_view bytes) {
    if (discarding_) {
        const auto newline = bytes.find('\n');
        if (newline == std::string_view::npos) {
            return;
        }
        discarding_ = false;
        bytes.remove_prefix(newline + 1);
    }
    buffer_.append(bytes);
}

std::optional<TransportResult<std::string>> LineFramer::next() {
    while (true) {
        const auto newline = buffer_.find('\n');

        if (newline == std::string::npos) {
            if (buffer_.size() > max_frame_size_) {
                buffer_.clear();
                discarding_ = true;
                return TransportResult<std::string>(tl::unexpected(protocol_error(
                    "frame exceeds " + std::to_string(max_frame_size_) + " bytes")));
            }
            return std::nullopt;
        }

        std::string line = buffer_.substr(0, newline);
        buffer_.erase(0, newline + 1);

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (is_blank(line)) {
            continue;
        }
        if (line.size() > max_frame_size_) {
            return TransportResult<std::string>(tl::unexpected(protocol_error(
                "frame exceeds " + std::to_string(max_frame_size_) + " bytes")));
        }
        return TransportResult<std::string>(std::move(line));
    }
}

}  // namespace devflow
