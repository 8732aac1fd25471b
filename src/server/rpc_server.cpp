#include "devflow/server/rpc_server.hpp"
#include "devflow/log/logger.hpp"
#include "devflow/transport/tcp_transport.hpp"

#ifndef _WIN32
#include "devflow/transport/pipe_transport.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>
#endif

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/use_future.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace devflow {

namespace {

constexpr auto kAcceptBackoff = std::chrono::milliseconds(50);

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// InFlightToken
// ─────────────────────────────────────────────────────────────────────────────
// Counts one request from dispatch until its response has been written (or
// dropped). wait_for_idle() waits for the count to reach zero.

class RpcServer::InFlightToken {
public:
    explicit InFlightToken(RpcServer& server)
        : server_(&server)
    {
        std::lock_guard lock(server_->idle_mutex_);
        ++server_->in_flight_;
    }

    InFlightToken(InFlightToken&& other) noexcept
        : server_(std::exchange(other.server_, nullptr))
    {}

    InFlightToken& operator=(InFlightToken&&) = delete;
    InFlightToken(const InFlightToken&) = delete;
    InFlightToken& operator=(const InFlightToken&) = delete;

    ~InFlightToken() {
        if (server_ == nullptr) {
            return;
        }
        {
            std::lock_guard lock(server_->idle_mutex_);
            --server_->in_flight_;
        }
        server_->idle_cv_.notify_all();
    }

private:
    RpcServer* server_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

RpcServer::RpcServer(RpcServerConfig config)
    : config_(std::move(config))
    , dispatcher_(registry_)
    , work_(asio::make_work_guard(io_))
    , handler_pool_(std::max<std::size_t>(config_.handler_threads, 1))
{
    auto added = registry_.add("ping", [](const Json&) -> HandlerResult {
        return Json{{"pong", true}};
    });
    if (!added) {
        throw std::logic_error(added.error().message);
    }
}

RpcServer::~RpcServer() {
    stop();
    if (abandoned_) {
        // Abandoned handlers return before any member goes away. What they
        // left queued is destroyed with handler_pool_ and io_.
        handler_pool_.join();
    }
}

ServerResult<void> RpcServer::register_method(std::string name, MethodHandler handler) {
    return registry_.add(std::move(name), std::move(handler));
}

ServerResult<void> RpcServer::register_group(std::string_view prefix,
                                             std::vector<HandlerRegistry::Entry> methods) {
    return registry_.add_group(prefix, std::move(methods));
}

void RpcServer::on_closed(std::function<void()> callback) {
    closed_callback_ = std::move(callback);
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

ServerResult<void> RpcServer::start() {
    if (stopped_) {
        return tl::unexpected(ServerError::stopped());
    }
    if (running_) {
        return tl::unexpected(ServerError::already_running());
    }

    registry_.freeze();

    auto opened = std::visit([this](const auto& endpoint) -> ServerResult<void> {
        using T = std::decay_t<decltype(endpoint)>;
        if constexpr (std::is_same_v<T, TcpListenEndpoint>) {
            return open_listener(endpoint);
        } else {
            return open_stdio(endpoint);
        }
    }, config_.endpoint);

    if (!opened) {
        DEVFLOW_LOG_ERROR("Server failed to start: {}", opened.error().message);
        return opened;
    }

    running_ = true;
    io_thread_ = std::thread([this] { io_.run(); });
    return {};
}

ServerResult<void> RpcServer::open_listener(const TcpListenEndpoint& endpoint) {
    asio::error_code ec;
    asio::ip::tcp::resolver resolver(io_);
    const auto resolved = resolver.resolve(endpoint.host, std::to_string(endpoint.port),
                                           asio::ip::tcp::resolver::passive, ec);
    if (ec || resolved.empty()) {
        return tl::unexpected(ServerError::bind_failed(
            "Cannot resolve " + endpoint.host + ": " + (ec ? ec.message() : "no addresses")));
    }
    const asio::ip::tcp::endpoint local = resolved.begin()->endpoint();

    auto& acceptor = acceptor_.emplace(io_);
    const std::string where = endpoint.host + ":" + std::to_string(endpoint.port);

    acceptor.open(local.protocol(), ec);
    if (!ec) {
        acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor.bind(local, ec);
    }
    if (!ec) {
        acceptor.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        asio::error_code ignored;
        acceptor.close(ignored);
        acceptor_.reset();
        return tl::unexpected(ServerError::bind_failed("Cannot listen on " + where + ": " + ec.message()));
    }

    const auto bound = acceptor.local_endpoint(ec);
    {
        std::lock_guard lock(state_mutex_);
        address_ = ServerAddress{endpoint.host, ec ? endpoint.port : bound.port()};
    }

    DEVFLOW_LOG_INFO("Listening on {}:{}", endpoint.host, address_->port);
    asio::co_spawn(io_, accept_loop(), asio::detached);
    return {};
}

ServerResult<void> RpcServer::open_stdio(const StdioEndpoint& endpoint) {
#ifdef _WIN32
    (void)endpoint;
    return tl::unexpected(ServerError::unsupported_transport(
        "stdio transport is not available on Windows; use TCP"));
#else
    const int read_fd = ::dup(endpoint.read_fd);
    if (read_fd < 0) {
        return tl::unexpected(ServerError::bind_failed(
            "Cannot duplicate input descriptor: " + std::string(std::strerror(errno))));
    }
    const int write_fd = ::dup(endpoint.write_fd);
    if (write_fd < 0) {
        const int saved = errno;
        ::close(read_fd);
        return tl::unexpected(ServerError::bind_failed(
            "Cannot duplicate output descriptor: " + std::string(std::strerror(saved))));
    }

    DEVFLOW_LOG_INFO("Serving JSON-RPC over stdio");
    launch_connection(std::make_shared<PipeTransport>(io_.get_executor(), read_fd, write_fd, config_.transport));
    return {};
#endif
}

void RpcServer::stop_accepting() {
    if (!running_) {
        return;
    }
    auto done = asio::post(io_, asio::use_future([this] {
        if (acceptor_ && acceptor_->is_open()) {
            asio::error_code ignored;
            acceptor_->close(ignored);
            DEVFLOW_LOG_INFO("No longer accepting connections");
        }
    }));
    done.get();
}

void RpcServer::stop(StopMode mode) {
    if (stopped_.exchange(true)) {
        return;
    }

    if (running_) {
        if (std::this_thread::get_id() == io_thread_.get_id()) {
            throw std::logic_error("RpcServer::stop() called from the server's I/O thread");
        }

        auto closed = asio::co_spawn(io_, close_everything(), asio::use_future);
        try {
            closed.get();
        } catch (const std::exception& e) {
            DEVFLOW_LOG_ERROR("Error while closing connections: {}", e.what());
        }
    }

    if (mode == StopMode::Abandon) {
        // Queued handlers never start. Continuations of running ones stay
        // queued on the stopped I/O context.
        abandoned_ = true;
        handler_pool_.stop();
        io_.stop();
    } else {
        // Handlers still queued or running complete; their responses meet a
        // closed transport and are dropped.
        handler_pool_.join();
    }

    work_.reset();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    running_ = false;
    DEVFLOW_LOG_INFO("Server stopped{}", mode == StopMode::Abandon ? " (running handlers abandoned)" : "");
}

bool RpcServer::wait_for_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(idle_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return in_flight_ == 0; });
}

std::optional<ServerAddress> RpcServer::address() const {
    std::lock_guard lock(state_mutex_);
    return address_;
}

std::size_t RpcServer::in_flight_requests() const {
    std::lock_guard lock(idle_mutex_);
    return in_flight_;
}

asio::awaitable<void> RpcServer::close_everything() {
    if (acceptor_) {
        asio::error_code ignored;
        acceptor_->close(ignored);
    }

    std::vector<std::shared_ptr<IAsyncTransport>> open;
    open.reserve(connections_.size());
    for (const auto& [id, transport] : connections_) {
        open.push_back(transport);
    }
    for (auto& transport : open) {
        co_await transport->async_stop();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Connections
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> RpcServer::accept_loop() {
    while (acceptor_ && acceptor_->is_open()) {
        asio::error_code ec;
        asio::ip::tcp::socket socket = co_await acceptor_->async_accept(
            asio::redirect_error(asio::use_awaitable, ec));

        if (ec == asio::error::operation_aborted || !acceptor_->is_open()) {
            break;
        }
        if (ec) {
            // Typically EMFILE; give the process a moment before retrying.
            DEVFLOW_LOG_WARN("Accept failed: {}", ec.message());
            asio::steady_timer backoff(io_, kAcceptBackoff);
            co_await backoff.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            continue;
        }

        launch_connection(std::make_shared<TcpTransport>(std::move(socket), config_.transport));
    }
    DEVFLOW_LOG_DEBUG("Accept loop finished");
}

void RpcServer::launch_connection(std::shared_ptr<IAsyncTransport> transport) {
    const std::uint64_t id = next_connection_id_++;
    connections_.emplace(id, transport);
    ++active_connections_;
    asio::co_spawn(io_, serve_connection(id, std::move(transport)), asio::detached);
}

asio::awaitable<void> RpcServer::serve_connection(std::uint64_t id, std::shared_ptr<IAsyncTransport> transport) {
    const bool stdio = std::holds_alternative<StdioEndpoint>(config_.endpoint);
    bool peer_gone = false;

    auto started = co_await transport->async_start();
    if (!started) {
        DEVFLOW_LOG_WARN("Cannot serve {}: {}", transport->describe(), started.error().message);
    } else {
        DEVFLOW_LOG_INFO("Client connected: {}", transport->describe());

        while (true) {
            auto frame = co_await transport->async_receive();
            if (!frame) {
                if (is_terminal(frame.error()) == false) {
                    co_await send_response(*transport, Dispatcher::parse_failure(frame.error()));
                    continue;
                }
                peer_gone = true;
                DEVFLOW_LOG_INFO("Client disconnected: {} ({})", transport->describe(), frame.error().message);
                break;
            }

            auto step = dispatcher_.prepare(*frame);
            if (auto* ready = std::get_if<JsonRpcResponse>(&step)) {
                co_await send_response(*transport, *ready);
                continue;
            }

            InFlightToken token(*this);
            auto call = std::get<PreparedCall>(std::move(step));
            if (config_.dispatch == DispatchMode::Concurrent) {
                asio::co_spawn(io_, run_call(transport, std::move(call), std::move(token)), asio::detached);
            } else {
                co_await run_call(transport, std::move(call), std::move(token));
            }
        }
    }

    co_await transport->async_stop();
    connections_.erase(id);
    --active_connections_;

    if (stdio && peer_gone && stopped_ == false && closed_callback_) {
        closed_callback_();
    }
}

asio::awaitable<void> RpcServer::run_call(std::shared_ptr<IAsyncTransport> transport, PreparedCall call,
                                          InFlightToken token) {
    JsonRpcResponse response = co_await asio::co_spawn(
        handler_pool_,
        [call = std::move(call)]() -> asio::awaitable<JsonRpcResponse> {
            co_return Dispatcher::invoke(call);
        },
        asio::use_awaitable);

    co_await send_response(*transport, response);
    (void)token;
}

asio::awaitable<void> RpcServer::send_response(IAsyncTransport& transport, const JsonRpcResponse& response) {
    auto sent = co_await transport.async_send(response.to_json());
    if (sent) {
        co_return;
    }

    if (sent.error().category == TransportError::Category::Protocol) {
        // The result did not fit in a frame; the caller still gets an answer.
        DEVFLOW_LOG_WARN("Response to {} dropped: {}", transport.describe(), sent.error().message);
        auto fallback = JsonRpcResponse::failure(
            response.id(), JsonRpcError::internal_error("response exceeds the frame size limit"));
        sent = co_await transport.async_send(fallback.to_json());
        if (sent) {
            co_return;
        }
    }
    DEVFLOW_LOG_DEBUG("Response to {} not delivered: {}", transport.describe(), sent.error().message);
}

}  // namespace devflow
