#include "devflow/transport/tcp_transport.hpp"
#include "devflow/log/logger.hpp"

#include <asio/bind_executor.hpp>
#include <asio/connect.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

namespace devflow {

namespace {

std::string endpoint_string(const asio::ip::tcp::socket& socket) {
    asio::error_code ec;
    const auto remote = socket.remote_endpoint(ec);
    if (ec) {
        return "tcp:<unconnected>";
    }
    return remote.address().to_string() + ":" + std::to_string(remote.port());
}

}  // namespace

TcpTransport::TcpTransport(asio::any_io_executor executor, TcpConnectOptions options,
                           FramedTransportConfig config)
    : FramedTransport(executor, config)
    , socket_(executor)
    , dial_(std::move(options))
    , peer_(dial_->host + ":" + std::to_string(dial_->port))
{}

TcpTransport::TcpTransport(asio::ip::tcp::socket socket, FramedTransportConfig config)
    : FramedTransport(socket.get_executor(), config)
    , socket_(std::move(socket))
    , peer_(endpoint_string(socket_))
{}

std::string TcpTransport::describe() const {
    return peer_;
}

asio::awaitable<TransportResult<void>> TcpTransport::open_streams() {
    if (dial_.has_value()) {
        auto connected = co_await connect();
        if (!connected) {
            co_return connected;
        }
    }

    if (socket_.is_open() == false) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Network,
            "Socket is not connected",
            std::nullopt
        });
    }

    asio::error_code ignored;
    socket_.set_option(asio::ip::tcp::no_delay(true), ignored);
    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<void>> TcpTransport::connect() {
    const auto& target = *dial_;
    auto executor = co_await asio::this_coro::executor;

    asio::error_code ec;
    asio::ip::tcp::resolver resolver(executor);
    const auto endpoints = co_await resolver.async_resolve(
        target.host, std::to_string(target.port),
        asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Network,
            "Cannot resolve " + peer_ + ": " + ec.message(),
            ec.value()
        });
    }

    // The timer closes the socket if the connect has not finished in time.
    struct ConnectState {
        bool done{false};
        bool timed_out{false};
    };
    auto state = std::make_shared<ConnectState>();
    asio::steady_timer deadline(executor);
    const bool has_deadline = target.connect_timeout.count() > 0;
    if (has_deadline) {
        deadline.expires_after(target.connect_timeout);
        deadline.async_wait(asio::bind_executor(strand(), [this, state](const asio::error_code& wait_ec) {
            if (!wait_ec && state->done == false) {
                state->timed_out = true;
                asio::error_code ignored;
                socket_.close(ignored);
            }
        }));
    }

    co_await asio::async_connect(socket_, endpoints, asio::redirect_error(asio::use_awaitable, ec));
    state->done = true;
    deadline.cancel();

    if (state->timed_out) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Timeout,
            "Connect to " + peer_ + " timed out after " +
                std::to_string(target.connect_timeout.count()) + "ms",
            std::nullopt
        });
    }
    if (ec) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Network,
            "Cannot connect to " + peer_ + ": " + ec.message(),
            ec.value()
        });
    }

    DEVFLOW_LOG_DEBUG("Connected to {}", peer_);
    co_return TransportResult<void>{};
}

asio::awaitable<std::size_t> TcpTransport::read_some(asio::mutable_buffer buffer) {
    co_return co_await socket_.async_read_some(buffer, asio::use_awaitable);
}

asio::awaitable<void> TcpTransport::write_all(asio::const_buffer buffer) {
    co_await asio::async_write(socket_, buffer, asio::use_awaitable);
}

void TcpTransport::close_streams() noexcept {
    asio::error_code ignored;
    if (socket_.is_open()) {
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
}

}  // namespace devflow
