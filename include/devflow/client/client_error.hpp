#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client Error
// ═══════════════════════════════════════════════════════════════════════════
// Error type for RpcClient and everything layered on it (BridgeManager,
// devflow-cli).

#include "devflow/protocol/json_rpc.hpp"
#include "devflow/transport.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace devflow {

enum class ClientErrorCode {
    NotConnected,      ///< No connection, or disconnect() ran while the call was pending
    ConnectionFailed,  ///< connect() could not reach the server
    ConnectionLost,    ///< Stream closed by the server or broken mid-call
    Timeout,           ///< No response within the request timeout
    TransportError,    ///< Local send failure
    ProtocolError,     ///< Response could not be interpreted
    RpcError           ///< Server answered with an error response
};

[[nodiscard]] constexpr std::string_view to_string(ClientErrorCode code) noexcept {
    switch (code) {
        case ClientErrorCode::NotConnected:     return "NotConnected";
        case ClientErrorCode::ConnectionFailed: return "ConnectionFailed";
        case ClientErrorCode::ConnectionLost:   return "ConnectionLost";
        case ClientErrorCode::Timeout:          return "Timeout";
        case ClientErrorCode::TransportError:   return "TransportError";
        case ClientErrorCode::ProtocolError:    return "ProtocolError";
        case ClientErrorCode::RpcError:         return "RpcError";
    }
    return "Unknown";
}

struct ClientError {
    ClientErrorCode code;
    std::string message;
    std::optional<JsonRpcError> rpc_error;  ///< Set when code == RpcError

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static ClientError not_connected() {
        return {ClientErrorCode::NotConnected, "Client is not connected", std::nullopt};
    }

    [[nodiscard]] static ClientError connection_failed(std::string msg) {
        return {ClientErrorCode::ConnectionFailed, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError connection_lost(std::string msg) {
        return {ClientErrorCode::ConnectionLost, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError timeout(std::string msg) {
        return {ClientErrorCode::Timeout, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError transport_error(std::string msg) {
        return {ClientErrorCode::TransportError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError protocol_error(std::string msg) {
        return {ClientErrorCode::ProtocolError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError from_rpc_error(JsonRpcError err) {
        std::string msg = err.message;
        return {ClientErrorCode::RpcError, std::move(msg), std::move(err)};
    }

    /// Connect-time transport failure: timeouts stay Timeout, the rest
    /// become ConnectionFailed.
    [[nodiscard]] static ClientError from_connect_failure(const TransportError& err) {
        if (err.category == TransportError::Category::Timeout) {
            return timeout(err.message);
        }
        return connection_failed(err.message);
    }
};

template <typename T>
using ClientResult = tl::expected<T, ClientError>;

}  // namespace devflow
