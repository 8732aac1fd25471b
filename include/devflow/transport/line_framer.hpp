#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Newline-delimited JSON framing
// ═══════════════════════════════════════════════════════════════════════════
// One JSON document per line, terminated by '\n'. A trailing '\r' is
// stripped and blank lines are skipped. A line longer than the frame limit
// is reported once as a Protocol error and its remaining bytes are dropped
// up to the next newline, so the stream stays usable.

#include "devflow/transport.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace devflow {

inline constexpr std::size_t kDefaultMaxFrameSize = 1 << 20;  // 1 MiB

/// Serialize `message` as a single frame, including the trailing newline.
[[nodiscard]] std::string encode_frame(const Json& message);

/// Parse one frame's payload. Invalid JSON yields a Protocol error.
[[nodiscard]] TransportResult<Json> decode_frame(std::string_view payload);

class LineFramer {
public:
    explicit LineFramer(std::size_t max_frame_size = kDefaultMaxFrameSize) noexcept
        : max_frame_size_(max_frame_size)
    {}

    void feed(std::string_view bytes);

    /// Next complete line (without terminator), a Protocol error for an
    /// oversized line, or nullopt when more bytes are needed.
    [[nodiscard]] std::optional<TransportResult<std::string>> next();

    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size(); }
    [[nodiscard]] std::size_t max_frame_size() const noexcept { return max_frame_size_; }

private:
    std::size_t max_frame_size_;
    std::string buffer_;
    bool discarding_{false};
};

}  // namespace devflow
