#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Async Transport Interface
// ═══════════════════════════════════════════════════════════════════════════
// Coroutine transport abstraction shared by the RPC server (one per accepted
// connection) and the RPC client (its single outbound connection).
//
// async_receive() yields every decoded frame in order. A Protocol error is
// non-terminal: it reports one bad frame and the stream continues. Network
// and Closed errors are terminal.

#include "devflow/transport.hpp"
#include "devflow/transport/line_framer.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <cstddef>
#include <string>

namespace devflow {

class IAsyncTransport {
public:
    virtual ~IAsyncTransport() = default;

    [[nodiscard]] virtual asio::any_io_executor get_executor() = 0;

    /// Open the underlying stream (connect, spawn, ...) and start reading.
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_start() = 0;

    /// Close the stream. Pending receives complete with a Closed error.
    [[nodiscard]] virtual asio::awaitable<void> async_stop() = 0;

    /// Queue one message for writing. Writes never interleave.
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_send(Json message) = 0;

    [[nodiscard]] virtual asio::awaitable<TransportResult<Json>> async_receive() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /// Human readable peer description for logs ("127.0.0.1:9876", "pid 4242").
    [[nodiscard]] virtual std::string describe() const = 0;
};

/// Returns true if `error` ends the stream rather than a single frame.
[[nodiscard]] inline bool is_terminal(const TransportError& error) noexcept {
    return error.category != TransportError::Category::Protocol;
}

struct FramedTransportConfig {
    std::size_t max_frame_size{kDefaultMaxFrameSize};

    /// Decoded frames buffered ahead of the consumer
    std::size_t inbox_capacity{64};

    /// Encoded frames waiting for the writer
    std::size_t outbox_capacity{64};
};

}  // namespace devflow
