#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// FramedTransport
// ═══════════════════════════════════════════════════════════════════════════
// Base for every byte-stream transport. Owns the two loops that run while the
// transport is up:
//
//   reader_loop  read_some -> LineFramer -> decode -> inbox channel
//   writer_loop  outbox channel -> write_all
//
// Subclasses only provide the stream: open it, read some bytes, write a
// buffer, close it. Loops keep the transport alive through shared_from_this,
// so instances must be owned by std::shared_ptr.

#include "devflow/transport/async_transport.hpp"

#include <asio/buffer.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <memory>
#include <optional>

namespace devflow {

class FramedTransport
    : public IAsyncTransport
    , public std::enable_shared_from_this<FramedTransport> {
public:
    FramedTransport(asio::any_io_executor executor, FramedTransportConfig config);
    ~FramedTransport() override = default;

    FramedTransport(const FramedTransport&) = delete;
    FramedTransport& operator=(const FramedTransport&) = delete;
    FramedTransport(FramedTransport&&) = delete;
    FramedTransport& operator=(FramedTransport&&) = delete;

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<void> async_stop() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(Json message) override;
    [[nodiscard]] asio::awaitable<TransportResult<Json>> async_receive() override;
    [[nodiscard]] bool is_running() const override;

    [[nodiscard]] const FramedTransportConfig& config() const noexcept { return config_; }

protected:
    /// Make the stream usable. Called once, on the transport's strand.
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> open_streams() = 0;

    /// Read at least one byte. Throws std::system_error (asio::error::eof at end).
    [[nodiscard]] virtual asio::awaitable<std::size_t> read_some(asio::mutable_buffer buffer) = 0;

    /// Write the whole buffer. Throws std::system_error.
    [[nodiscard]] virtual asio::awaitable<void> write_all(asio::const_buffer buffer) = 0;

    /// Close the stream; pending reads and writes complete with an error.
    virtual void close_streams() noexcept = 0;

    [[nodiscard]] asio::strand<asio::any_io_executor>& strand() noexcept { return strand_; }

private:
    asio::awaitable<void> reader_loop();
    asio::awaitable<void> writer_loop();

    using Inbox = asio::experimental::channel<void(asio::error_code, TransportResult<Json>)>;
    using Outbox = asio::experimental::channel<void(asio::error_code, std::string)>;

    FramedTransportConfig config_;
    asio::any_io_executor executor_;
    asio::strand<asio::any_io_executor> strand_;

    std::unique_ptr<Inbox> inbox_;
    std::unique_ptr<Outbox> outbox_;

    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> terminal_delivered_{false};
};

}  // namespace devflow
