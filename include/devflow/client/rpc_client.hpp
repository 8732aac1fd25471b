#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// RPC Client
// ═══════════════════════════════════════════════════════════════════════════
// Blocking request/response interface over one connection to an RpcServer.
//
// The client owns an I/O thread that runs the transport and a receive loop.
// Any number of threads may call() at once; every call gets a fresh integer
// id and is completed by the response carrying that id, whatever order
// responses arrive in.
//
// A pending call completes exactly once, with:
//   - the server's result, or ClientErrorCode::RpcError,
//   - Timeout when request_timeout elapses first (the server is not told),
//   - ConnectionLost when the server closes or the stream breaks,
//   - NotConnected when disconnect() runs first.
//
// Nothing is retried. Reconnecting is a new connect().
//
// Example:
//   RpcClient client;
//   if (auto ok = client.connect(TcpEndpoint{"127.0.0.1", 9876}); !ok) { ... }
//   auto sum = client.call("add", {{"a", 5}, {"b", 3}});

#include "devflow/client/client_error.hpp"
#include "devflow/transport/async_transport.hpp"

#include <asio/awaitable.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

namespace devflow {

struct TcpEndpoint {
    std::string host{kDefaultServiceHost};
    std::uint16_t port{kDefaultServicePort};
};

/// Spawn the server and speak over its stdin/stdout (POSIX only).
struct SubprocessCommand {
    std::string command;
    std::vector<std::string> args{};
    std::optional<std::filesystem::path> working_dir{};
    bool discard_stderr{false};
};

using TransportDescriptor = std::variant<TcpEndpoint, SubprocessCommand>;

[[nodiscard]] std::string describe(const TransportDescriptor& descriptor);

struct RpcClientConfig {
    /// Per-call deadline; 0 disables it.
    std::chrono::milliseconds request_timeout{30000};

    /// TCP connect deadline; 0 disables it.
    std::chrono::milliseconds connect_timeout{5000};

    FramedTransportConfig transport{};

    RpcClientConfig& with_request_timeout(std::chrono::milliseconds timeout) {
        request_timeout = timeout;
        return *this;
    }

    RpcClientConfig& with_connect_timeout(std::chrono::milliseconds timeout) {
        connect_timeout = timeout;
        return *this;
    }
};

class RpcClient {
public:
    explicit RpcClient(RpcClientConfig config = {});
    ~RpcClient();

    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;
    RpcClient(RpcClient&&) = delete;
    RpcClient& operator=(RpcClient&&) = delete;

    /// Blocks until connected or failed (ConnectionFailed / Timeout).
    ClientResult<void> connect(const TransportDescriptor& descriptor);

    /// Pending calls fail with NotConnected. No-op when not connected.
    void disconnect();

    [[nodiscard]] bool is_connected() const;

    /// Called on the client's I/O thread when the peer closes the stream or
    /// it breaks, after pending calls have failed. Not called for
    /// disconnect(). The callback must not call() this client.
    void on_connection_lost(std::function<void(const ClientError&)> callback);

    /// Blocks until the call completes. Must not be called from a callback
    /// running on the client's own I/O thread.
    [[nodiscard]] ClientResult<Json> call(std::string_view method, Json params = Json::object());

    [[nodiscard]] std::future<ClientResult<Json>> call_async(std::string_view method,
                                                             Json params = Json::object());

    [[nodiscard]] std::size_t pending_calls() const;

    [[nodiscard]] const RpcClientConfig& config() const noexcept { return config_; }

private:
    using Promise = std::promise<ClientResult<Json>>;

    struct PendingCall {
        std::shared_ptr<Promise> promise;
        std::shared_ptr<asio::steady_timer> timer;
    };

    using PendingMap = std::unordered_map<std::int64_t, PendingCall>;

    [[nodiscard]] std::shared_ptr<IAsyncTransport> make_transport(const TransportDescriptor& descriptor);

    asio::awaitable<void> send_request(std::shared_ptr<IAsyncTransport> transport, std::int64_t id, Json request);
    asio::awaitable<void> receive_loop(std::shared_ptr<IAsyncTransport> transport, std::uint64_t generation);

    void complete(std::int64_t id, ClientResult<Json> outcome);
    static void fail_all(PendingMap& pending, const ClientError& error);

    RpcClientConfig config_;

    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    std::thread io_thread_;

    std::mutex connect_mutex_;  // serialises connect() and disconnect()

    mutable std::mutex mutex_;
    std::shared_ptr<IAsyncTransport> transport_;
    bool connected_{false};
    std::uint64_t generation_{0};
    std::int64_t next_id_{1};
    PendingMap pending_;
    std::function<void(const ClientError&)> lost_callback_;
};

}  // namespace devflow
