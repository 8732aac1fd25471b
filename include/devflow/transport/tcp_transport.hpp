#pragma once

#include "devflow/transport/framed_transport.hpp"

#include <asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace devflow {

struct TcpConnectOptions {
    std::string host{kDefaultServiceHost};
    std::uint16_t port{0};
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(5)};
};

// ─────────────────────────────────────────────────────────────────────────────
// TcpTransport
// ─────────────────────────────────────────────────────────────────────────────
// Either dials out (client) or wraps a socket returned by accept (server).

class TcpTransport final : public FramedTransport {
public:
    /// Outbound: async_start() resolves and connects within connect_timeout.
    TcpTransport(asio::any_io_executor executor, TcpConnectOptions options,
                 FramedTransportConfig config = {});

    /// Inbound: `socket` is already connected.
    explicit TcpTransport(asio::ip::tcp::socket socket, FramedTransportConfig config = {});

    [[nodiscard]] std::string describe() const override;

protected:
    [[nodiscard]] asio::awaitable<TransportResult<void>> open_streams() override;
    [[nodiscard]] asio::awaitable<std::size_t> read_some(asio::mutable_buffer buffer) override;
    [[nodiscard]] asio::awaitable<void> write_all(asio::const_buffer buffer) override;
    void close_streams() noexcept override;

private:
    asio::awaitable<TransportResult<void>> connect();

    asio::ip::tcp::socket socket_;
    std::optional<TcpConnectOptions> dial_;
    std::string peer_;
};

[[nodiscard]] inline std::shared_ptr<TcpTransport> make_tcp_transport(
    asio::any_io_executor executor,
    TcpConnectOptions options,
    FramedTransportConfig config = {}
) {
    return std::make_shared<TcpTransport>(std::move(executor), std::move(options), config);
}

}  // namespace devflow
