#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// RPC Server
// ═══════════════════════════════════════════════════════════════════════════
// Serves the handler registry over a TCP listener or over a pipe pair
// (stdio mode, one connection).
//
// Threading: one I/O thread runs the acceptor and every connection's receive
// loop; handlers run on a separate pool. Within a connection, requests are
// dispatched concurrently by default and each response carries its
// request's id, so responses may leave in a different order than requests
// arrived.
//
//   RpcServer server(RpcServerConfig{}.with_tcp("127.0.0.1", 0));
//   server.register_method("echo", [](const Json& p) -> HandlerResult { return p; });
//   server.start();
//   auto port = server.address()->port;
//   ...
//   server.stop();

#include "devflow/server/dispatcher.hpp"
#include "devflow/server/handler_registry.hpp"
#include "devflow/transport/async_transport.hpp"

#include <asio/awaitable.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <variant>

namespace devflow {

struct TcpListenEndpoint {
    std::string host{kDefaultServiceHost};
    std::uint16_t port{kDefaultServicePort};  // 0 = any free port
};

/// Serve one connection over a pair of descriptors. The server works on
/// duplicates, so the caller's descriptors stay valid.
struct StdioEndpoint {
    int read_fd{0};
    int write_fd{1};
};

using ServerEndpoint = std::variant<TcpListenEndpoint, StdioEndpoint>;

enum class DispatchMode {
    Concurrent,  // each request runs as soon as it is read
    Sequential   // one request at a time per connection, in arrival order
};

struct RpcServerConfig {
    ServerEndpoint endpoint{TcpListenEndpoint{}};
    DispatchMode dispatch{DispatchMode::Concurrent};
    std::size_t handler_threads{4};
    FramedTransportConfig transport{};

    RpcServerConfig& with_tcp(std::string host, std::uint16_t port) {
        endpoint = TcpListenEndpoint{std::move(host), port};
        return *this;
    }

    RpcServerConfig& with_stdio(int read_fd = 0, int write_fd = 1) {
        endpoint = StdioEndpoint{read_fd, write_fd};
        return *this;
    }

    RpcServerConfig& with_dispatch(DispatchMode mode) {
        dispatch = mode;
        return *this;
    }

    RpcServerConfig& with_handler_threads(std::size_t count) {
        handler_threads = count;
        return *this;
    }
};

/// What stop() does with handlers that are still running.
enum class StopMode {
    Join,     // wait for them to return
    Abandon   // leave their threads running and return at once
};

struct ServerAddress {
    std::string host;
    std::uint16_t port{0};
};

class RpcServer {
public:
    explicit RpcServer(RpcServerConfig config = {});
    ~RpcServer();

    RpcServer(const RpcServer&) = delete;
    RpcServer& operator=(const RpcServer&) = delete;
    RpcServer(RpcServer&&) = delete;
    RpcServer& operator=(RpcServer&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Registration (before start only)
    // ─────────────────────────────────────────────────────────────────────────

    /// "ping" is pre-registered and answers {"pong": true}.
    ServerResult<void> register_method(std::string name, MethodHandler handler);
    ServerResult<void> register_group(std::string_view prefix, std::vector<HandlerRegistry::Entry> methods);

    [[nodiscard]] const HandlerRegistry& registry() const noexcept { return registry_; }

    /// Called on the I/O thread when the stdio peer closes its end. Must be
    /// set before start() and must not call stop() itself.
    void on_closed(std::function<void()> callback);

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Bind and begin serving. The registry is frozen from here on.
    ServerResult<void> start();

    /// Close the listener; existing connections keep being served.
    void stop_accepting();

    /// Close the listener and every connection, then join all threads.
    /// Handlers already running finish; their responses are dropped.
    /// With StopMode::Abandon, threads still inside a handler are not
    /// waited for and the server must outlive them: destroying it blocks
    /// until they return.
    /// A stopped server cannot be started again.
    void stop(StopMode mode = StopMode::Join);

    /// Wait until no handler is running or queued. True if idle in time.
    [[nodiscard]] bool wait_for_idle(std::chrono::milliseconds timeout);

    [[nodiscard]] bool is_running() const noexcept { return running_; }

    /// Bound TCP address, with the real port when configured with port 0.
    [[nodiscard]] std::optional<ServerAddress> address() const;

    [[nodiscard]] std::size_t active_connections() const noexcept { return active_connections_; }
    [[nodiscard]] std::size_t in_flight_requests() const;

private:
    class InFlightToken;

    ServerResult<void> open_listener(const TcpListenEndpoint& endpoint);
    ServerResult<void> open_stdio(const StdioEndpoint& endpoint);

    asio::awaitable<void> accept_loop();
    void launch_connection(std::shared_ptr<IAsyncTransport> transport);
    asio::awaitable<void> serve_connection(std::uint64_t id, std::shared_ptr<IAsyncTransport> transport);
    asio::awaitable<void> run_call(std::shared_ptr<IAsyncTransport> transport, PreparedCall call,
                                   InFlightToken token);
    asio::awaitable<void> send_response(IAsyncTransport& transport, const JsonRpcResponse& response);
    asio::awaitable<void> close_everything();

    RpcServerConfig config_;
    HandlerRegistry registry_;
    Dispatcher dispatcher_;
    std::function<void()> closed_callback_;

    // Declared before io_ and handler_pool_: continuations of abandoned
    // handlers release their in-flight tokens when those are torn down.
    mutable std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
    std::size_t in_flight_{0};

    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    asio::thread_pool handler_pool_;
    std::thread io_thread_;

    std::optional<asio::ip::tcp::acceptor> acceptor_;
    std::unordered_map<std::uint64_t, std::shared_ptr<IAsyncTransport>> connections_;  // I/O thread only
    std::uint64_t next_connection_id_{0};

    mutable std::mutex state_mutex_;
    std::optional<ServerAddress> address_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<std::size_t> active_connections_{0};
    std::atomic<bool> abandoned_{false};
};

}  // namespace devflow
