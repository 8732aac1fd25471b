#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared by the stdio pipe, subprocess and TCP transports.

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace devflow {

using Json = nlohmann::json;

/// Where the service listens, and where TCP clients look for it, unless
/// configured otherwise.
inline constexpr std::string_view kDefaultServiceHost = "127.0.0.1";
inline constexpr std::uint16_t kDefaultServicePort = 9876;

/// Error type for transport operations
struct TransportError {
    enum class Category {
        Network,   // connect/read/write failure
        Timeout,   // connect deadline elapsed
        Protocol,  // bytes arrived but did not form a valid frame
        Closed     // peer closed the stream (EOF) or the transport was stopped
    };

    Category category{};
    std::string message;
    std::optional<int> error_code{};
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Network:  return "network";
        case TransportError::Category::Timeout:  return "timeout";
        case TransportError::Category::Protocol: return "protocol";
        case TransportError::Category::Closed:   return "closed";
    }
    return "unknown";
}

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace devflow
