#include "devflow/client/rpc_client.hpp"
#include "devflow/log/logger.hpp"
#include "devflow/protocol/json_rpc.hpp"
#include "devflow/transport/tcp_transport.hpp"

#ifndef _WIN32
#include "devflow/transport/pipe_transport.hpp"
#endif

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/use_future.hpp>

namespace devflow {

std::string describe(const TransportDescriptor& descriptor) {
    if (const auto* tcp = std::get_if<TcpEndpoint>(&descriptor)) {
        return "tcp://" + tcp->host + ":" + std::to_string(tcp->port);
    }
    const auto& sub = std::get<SubprocessCommand>(descriptor);
    std::string text = "subprocess:" + sub.command;
    for (const auto& arg : sub.args) {
        text += " " + arg;
    }
    return text;
}

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

RpcClient::RpcClient(RpcClientConfig config)
    : config_(std::move(config))
    , work_(asio::make_work_guard(io_))
    , io_thread_([this] { io_.run(); })
{}

RpcClient::~RpcClient() {
    disconnect();
    work_.reset();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Connection Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

std::shared_ptr<IAsyncTransport> RpcClient::make_transport(const TransportDescriptor& descriptor) {
    if (const auto* tcp = std::get_if<TcpEndpoint>(&descriptor)) {
        return make_tcp_transport(
            io_.get_executor(),
            TcpConnectOptions{tcp->host, tcp->port, config_.connect_timeout},
            config_.transport
        );
    }

#ifdef _WIN32
    return nullptr;
#else
    const auto& sub = std::get<SubprocessCommand>(descriptor);
    SubprocessOptions options;
    options.command = sub.command;
    options.args = sub.args;
    options.working_dir = sub.working_dir;
    options.stderr_handling = sub.discard_stderr ? StderrHandling::Discard : StderrHandling::Inherit;
    return make_process_transport(io_.get_executor(), std::move(options), config_.transport);
#endif
}

ClientResult<void> RpcClient::connect(const TransportDescriptor& descriptor) {
    std::lock_guard connect_lock(connect_mutex_);

    if (is_connected()) {
        return tl::unexpected(ClientError::connection_failed("Already connected"));
    }

    auto transport = make_transport(descriptor);
    if (!transport) {
        return tl::unexpected(ClientError::connection_failed(
            "Subprocess transport is not available on this platform"));
    }

    TransportResult<void> started;
    try {
        started = asio::co_spawn(io_, transport->async_start(), asio::use_future).get();
    } catch (const std::exception& e) {
        DEVFLOW_LOG_ERROR("Connecting to {} threw: {}", describe(descriptor), e.what());
        return tl::unexpected(ClientError::connection_failed(e.what()));
    }
    if (!started) {
        DEVFLOW_LOG_WARN("Cannot connect to {}: {}", describe(descriptor), started.error().message);
        return tl::unexpected(ClientError::from_connect_failure(started.error()));
    }

    std::uint64_t generation = 0;
    {
        std::lock_guard lock(mutex_);
        transport_ = transport;
        connected_ = true;
        generation = ++generation_;
    }

    asio::co_spawn(io_, receive_loop(transport, generation), asio::detached);
    DEVFLOW_LOG_INFO("Connected to {}", transport->describe());
    return {};
}

void RpcClient::disconnect() {
    std::lock_guard connect_lock(connect_mutex_);

    std::shared_ptr<IAsyncTransport> transport;
    PendingMap pending;
    {
        std::lock_guard lock(mutex_);
        if (!connected_) {
            return;
        }
        connected_ = false;
        ++generation_;
        transport = std::move(transport_);
        pending.swap(pending_);
    }

    // Timers and the transport belong to the I/O thread.
    auto done = asio::co_spawn(
        io_,
        [transport, pending = std::move(pending)]() mutable -> asio::awaitable<void> {
            fail_all(pending, ClientError::not_connected());
            co_await transport->async_stop();
        },
        asio::use_future
    );
    try {
        done.get();
    } catch (const std::exception& e) {
        DEVFLOW_LOG_ERROR("Error while disconnecting: {}", e.what());
    }
    DEVFLOW_LOG_INFO("Disconnected");
}

bool RpcClient::is_connected() const {
    std::lock_guard lock(mutex_);
    return connected_;
}

void RpcClient::on_connection_lost(std::function<void(const ClientError&)> callback) {
    std::lock_guard lock(mutex_);
    lost_callback_ = std::move(callback);
}

std::size_t RpcClient::pending_calls() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

// ═══════════════════════════════════════════════════════════════════════════
// Calls
// ═══════════════════════════════════════════════════════════════════════════

ClientResult<Json> RpcClient::call(std::string_view method, Json params) {
    return call_async(method, std::move(params)).get();
}

std::future<ClientResult<Json>> RpcClient::call_async(std::string_view method, Json params) {
    auto promise = std::make_shared<Promise>();
    auto future = promise->get_future();

    std::int64_t id = 0;
    std::shared_ptr<IAsyncTransport> transport;
    {
        std::lock_guard lock(mutex_);
        if (!connected_) {
            promise->set_value(tl::unexpected(ClientError::not_connected()));
            return future;
        }
        id = next_id_++;
        transport = transport_;
        pending_.emplace(id, PendingCall{promise, nullptr});
    }

    Json request = JsonRpcRequest(std::string(method), id, std::move(params)).to_json();
    asio::co_spawn(io_, send_request(std::move(transport), id, std::move(request)), asio::detached);
    return future;
}

asio::awaitable<void> RpcClient::send_request(std::shared_ptr<IAsyncTransport> transport,
                                              std::int64_t id, Json request) {
    if (config_.request_timeout.count() > 0) {
        auto timer = std::make_shared<asio::steady_timer>(io_, config_.request_timeout);
        bool armed = false;
        {
            std::lock_guard lock(mutex_);
            if (auto it = pending_.find(id); it != pending_.end()) {
                it->second.timer = timer;
                armed = true;
            }
        }
        if (armed) {
            const auto timeout = config_.request_timeout;
            timer->async_wait([this, id, timeout](const asio::error_code& ec) {
                if (ec) {
                    return;
                }
                complete(id, tl::unexpected(ClientError::timeout(
                    "Request " + std::to_string(id) + " timed out after " +
                    std::to_string(timeout.count()) + "ms")));
            });
        }
    }

    auto sent = co_await transport->async_send(std::move(request));
    if (!sent) {
        if (sent.error().category == TransportError::Category::Closed) {
            complete(id, tl::unexpected(ClientError::connection_lost(sent.error().message)));
        } else {
            complete(id, tl::unexpected(ClientError::transport_error(sent.error().message)));
        }
    }
}

void RpcClient::complete(std::int64_t id, ClientResult<Json> outcome) {
    PendingCall call;
    {
        std::lock_guard lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return;  // already completed, timed out or disconnected
        }
        call = std::move(it->second);
        pending_.erase(it);
    }
    if (call.timer) {
        call.timer->cancel();
    }
    call.promise->set_value(std::move(outcome));
}

void RpcClient::fail_all(PendingMap& pending, const ClientError& error) {
    for (auto& [id, call] : pending) {
        if (call.timer) {
            call.timer->cancel();
        }
        call.promise->set_value(tl::unexpected(error));
    }
    pending.clear();
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Receive Loop
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> RpcClient::receive_loop(std::shared_ptr<IAsyncTransport> transport,
                                              std::uint64_t generation) {
    std::string reason;
    while (true) {
        auto message = co_await transport->async_receive();
        if (!message) {
            if (is_terminal(message.error()) == false) {
                DEVFLOW_LOG_WARN("Discarding unreadable frame from {}: {}",
                                 transport->describe(), message.error().message);
                continue;
            }
            reason = message.error().message;
            break;
        }

        auto response = JsonRpcResponse::from_json(*message);
        if (!response) {
            DEVFLOW_LOG_WARN("Discarding invalid response from {}: {}",
                             transport->describe(), response.error().message);
            continue;
        }

        const auto& id = response->id();
        const auto* numeric = id ? std::get_if<std::int64_t>(&id->value) : nullptr;
        if (numeric == nullptr) {
            // The server could not read one of our frames; nothing to correlate.
            if (response->is_error()) {
                DEVFLOW_LOG_WARN("Server reported an uncorrelated error: {}", response->error()->message);
            }
            continue;
        }

        if (response->is_error()) {
            complete(*numeric, tl::unexpected(ClientError::from_rpc_error(*response->error())));
        } else {
            complete(*numeric, response->result());
        }
    }

    PendingMap orphaned;
    std::function<void(const ClientError&)> lost_callback;
    {
        std::lock_guard lock(mutex_);
        if (generation != generation_) {
            co_return;  // disconnect() already took over
        }
        connected_ = false;
        transport_.reset();
        orphaned.swap(pending_);
        lost_callback = lost_callback_;
    }

    DEVFLOW_LOG_WARN("Connection to {} lost: {}", transport->describe(), reason);
    const auto error = ClientError::connection_lost("Connection lost: " + reason);
    fail_all(orphaned, error);
    if (lost_callback) {
        lost_callback(error);
    }
    co_await transport->async_stop();
}

}  // namespace devflow
