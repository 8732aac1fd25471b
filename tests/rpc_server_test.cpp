// ─────────────────────────────────────────────────────────────────────────────
// RPC Server and Client Integration Tests
// ─────────────────────────────────────────────────────────────────────────────
// A real RpcServer on 127.0.0.1 with an OS-assigned port, driven by RpcClient
// and, for malformed input, by a raw socket.

#include <catch2/catch_test_macros.hpp>

#include "devflow/client/rpc_client.hpp"
#include "devflow/server/rpc_server.hpp"

#include "mocks/test_handlers.hpp"

#include <asio/connect.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read_until.hpp>
#include <asio/streambuf.hpp>
#include <asio/write.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <istream>
#include <thread>
#include <vector>

using namespace devflow;
using namespace devflow::testing;
using namespace std::chrono_literals;

namespace {

std::unique_ptr<RpcServer> start_test_server(DispatchMode mode = DispatchMode::Concurrent) {
    auto server = std::make_unique<RpcServer>(
        RpcServerConfig{}.with_tcp("127.0.0.1", 0).with_dispatch(mode));
    REQUIRE(server->register_group("", test_methods()).has_value());
    REQUIRE(server->start().has_value());
    return server;
}

TcpEndpoint endpoint_of(const RpcServer& server) {
    const auto address = server.address();
    REQUIRE(address.has_value());
    return TcpEndpoint{address->host, address->port};
}

// Blocking line-oriented peer for byte-level tests.
class RawConnection {
public:
    explicit RawConnection(const RpcServer& server)
        : socket_(io_)
    {
        const auto address = server.address();
        REQUIRE(address.has_value());
        socket_.connect(asio::ip::tcp::endpoint(asio::ip::make_address(address->host), address->port));
    }

    void send(const std::string& bytes) {
        asio::write(socket_, asio::buffer(bytes));
    }

    Json receive() {
        asio::read_until(socket_, buffer_, '\n');
        std::istream in(&buffer_);
        std::string line;
        std::getline(in, line);
        return Json::parse(line);
    }

private:
    asio::io_context io_;
    asio::ip::tcp::socket socket_;
    asio::streambuf buffer_;
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Server binds an OS-assigned port", "[server][lifecycle]") {
    auto server = start_test_server();

    REQUIRE(server->is_running());
    REQUIRE(server->address()->host == "127.0.0.1");
    REQUIRE(server->address()->port != 0);

    server->stop();
    REQUIRE(server->is_running() == false);
}

TEST_CASE("Server cannot start twice or restart", "[server][lifecycle]") {
    auto server = start_test_server();

    auto again = server->start();
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code == ServerError::Code::AlreadyRunning);

    server->stop();
    server->stop();  // idempotent

    auto restarted = server->start();
    REQUIRE_FALSE(restarted.has_value());
    REQUIRE(restarted.error().code == ServerError::Code::Stopped);
}

TEST_CASE("Registration closes when the server starts", "[server][registry]") {
    auto server = start_test_server();

    auto late = server->register_method("late", echo_handler);
    REQUIRE_FALSE(late.has_value());
    REQUIRE(late.error().code == ServerError::Code::RegistryFrozen);

    auto duplicate_ping = RpcServer().register_method("ping", echo_handler);
    REQUIRE(duplicate_ping.error().code == ServerError::Code::DuplicateMethod);
}

TEST_CASE("Binding a port in use fails", "[server][lifecycle][error]") {
    auto first = start_test_server();

    RpcServer second(RpcServerConfig{}.with_tcp("127.0.0.1", first->address()->port));
    auto started = second.start();
    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().code == ServerError::Code::BindFailed);
}

// ═══════════════════════════════════════════════════════════════════════════
// Calls
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Client calls registered methods", "[server][client]") {
    auto server = start_test_server();
    RpcClient client;
    REQUIRE(client.connect(endpoint_of(*server)).has_value());
    REQUIRE(client.is_connected());

    auto pong = client.call("ping");
    REQUIRE(pong.has_value());
    REQUIRE(*pong == Json{{"pong", true}});

    auto echoed = client.call("echo", {{"message", "hi"}});
    REQUIRE(echoed.has_value());
    REQUIRE(*echoed == Json{{"message", "hi"}});

    auto sum = client.call("add", {{"a", 5}, {"b", 3}});
    REQUIRE(sum.has_value());
    REQUIRE(*sum == Json{{"result", 8}});

    client.disconnect();
    REQUIRE(client.is_connected() == false);
}

TEST_CASE("Errors from the server reach the caller", "[server][client][error]") {
    auto server = start_test_server();
    RpcClient client;
    REQUIRE(client.connect(endpoint_of(*server)).has_value());

    SECTION("Unknown method") {
        auto result = client.call("nope");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ClientErrorCode::RpcError);
        REQUIRE(result.error().rpc_error->code == -32601);
    }

    SECTION("Invalid params") {
        auto result = client.call("add", {{"a", 1}});
        REQUIRE(result.error().rpc_error->code == -32602);
    }

    SECTION("Handler error with data") {
        auto result = client.call("fail");
        REQUIRE(result.error().rpc_error->code == -32000);
        REQUIRE(result.error().rpc_error->data == Json{{"limit", 3}});
    }

    // The connection survives every kind of error
    REQUIRE(client.call("ping").has_value());
}

TEST_CASE("Malformed frames get -32700 and the connection stays open", "[server][protocol]") {
    auto server = start_test_server();
    RawConnection raw(*server);

    raw.send("this is not json\n");
    const Json parse_error = raw.receive();
    REQUIRE(parse_error["jsonrpc"] == "2.0");
    REQUIRE(parse_error["id"].is_null());
    REQUIRE(parse_error["error"]["code"] == -32700);

    raw.send("{\"jsonrpc\":\"2.0\",\"method\":\"ping\"}\n");
    REQUIRE(raw.receive()["error"]["code"] == -32600);

    raw.send("{\"jsonrpc\":\"2.0\",\"id\":\"after\",\"method\":\"echo\",\"params\":{\"text\":\"ok\"}}\r\n");
    const Json echoed = raw.receive();
    REQUIRE(echoed["id"] == "after");
    REQUIRE(echoed["result"]["text"] == "ok");
}

TEST_CASE("Concurrent calls on one connection", "[server][client][concurrency]") {
    auto server = start_test_server();
    RpcClient client;
    REQUIRE(client.connect(endpoint_of(*server)).has_value());

    SECTION("Many overlapping calls all resolve to their own result") {
        std::vector<std::future<ClientResult<Json>>> calls;
        for (int i = 0; i < 20; ++i) {
            calls.push_back(client.call_async("add", {{"a", i}, {"b", 10}, {"delay_ms", 5}}));
        }
        for (int i = 0; i < 20; ++i) {
            auto result = calls[i].get();
            REQUIRE(result.has_value());
            REQUIRE((*result)["result"] == i + 10);
        }
    }

    SECTION("A slow call does not hold up a fast one") {
        auto slow = client.call_async("add", {{"a", 10}, {"b", 20}, {"delay_ms", 400}});
        auto fast = client.call_async("add", {{"a", 2}, {"b", 3}});

        auto fast_result = fast.get();
        REQUIRE(fast_result.has_value());
        REQUIRE((*fast_result)["result"] == 5);
        REQUIRE(slow.wait_for(0ms) == std::future_status::timeout);

        auto slow_result = slow.get();
        REQUIRE((*slow_result)["result"] == 30);
    }

    REQUIRE(client.pending_calls() == 0);
}

TEST_CASE("Sequential dispatch answers in arrival order", "[server][client][concurrency]") {
    auto server = start_test_server(DispatchMode::Sequential);
    RpcClient client;
    REQUIRE(client.connect(endpoint_of(*server)).has_value());

    const auto started = std::chrono::steady_clock::now();
    auto slow = client.call_async("add", {{"a", 1}, {"b", 1}, {"delay_ms", 200}});
    auto fast = client.call_async("add", {{"a", 2}, {"b", 2}});

    REQUIRE((*fast.get())["result"] == 4);
    REQUIRE(std::chrono::steady_clock::now() - started >= 200ms);
    REQUIRE(slow.wait_for(0ms) == std::future_status::ready);
    REQUIRE((*slow.get())["result"] == 2);
}

TEST_CASE("Several clients share one server", "[server][client][concurrency]") {
    auto server = start_test_server();

    std::vector<std::thread> workers;
    std::atomic<int> successes{0};
    for (int c = 0; c < 4; ++c) {
        workers.emplace_back([&, c] {
            RpcClient client;
            if (!client.connect(endpoint_of(*server))) {
                return;
            }
            for (int i = 0; i < 10; ++i) {
                auto result = client.call("add", {{"a", c}, {"b", i}});
                if (result && (*result)["result"] == c + i) {
                    ++successes;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    REQUIRE(successes == 40);
}

// ═══════════════════════════════════════════════════════════════════════════
// Client failure modes
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Calling before connecting fails fast", "[client][error]") {
    RpcClient client;
    auto result = client.call("ping");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ClientErrorCode::NotConnected);
}

TEST_CASE("Connecting to a closed port fails", "[client][error]") {
    std::uint16_t port = 0;
    {
        auto server = start_test_server();
        port = server->address()->port;
    }

    RpcClient client(RpcClientConfig{}.with_connect_timeout(2s));
    auto connected = client.connect(TcpEndpoint{"127.0.0.1", port});
    REQUIRE_FALSE(connected.has_value());
    REQUIRE(connected.error().code == ClientErrorCode::ConnectionFailed);
    REQUIRE(client.is_connected() == false);
}

TEST_CASE("Connecting twice is rejected", "[client][error]") {
    auto server = start_test_server();
    RpcClient client;
    REQUIRE(client.connect(endpoint_of(*server)).has_value());

    auto again = client.connect(endpoint_of(*server));
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code == ClientErrorCode::ConnectionFailed);
    REQUIRE(client.call("ping").has_value());
}

TEST_CASE("Calls time out without blocking the connection", "[client][timeout]") {
    auto server = start_test_server();
    RpcClient client(RpcClientConfig{}.with_request_timeout(100ms));
    REQUIRE(client.connect(endpoint_of(*server)).has_value());

    auto slow = client.call("sleep", {{"ms", 500}});
    REQUIRE_FALSE(slow.has_value());
    REQUIRE(slow.error().code == ClientErrorCode::Timeout);
    REQUIRE(client.pending_calls() == 0);

    // The late response is dropped; later calls still work
    std::this_thread::sleep_for(500ms);
    auto pong = client.call("ping");
    REQUIRE(pong.has_value());
}

TEST_CASE("Server shutdown fails calls in flight", "[server][client][lifecycle]") {
    auto server = start_test_server();
    RpcClient client;
    REQUIRE(client.connect(endpoint_of(*server)).has_value());

    auto pending = client.call_async("sleep", {{"ms", 300}});
    std::this_thread::sleep_for(50ms);
    REQUIRE(server->in_flight_requests() == 1);

    std::thread stopper([&] { server->stop(); });
    auto result = pending.get();
    stopper.join();

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ClientErrorCode::ConnectionLost);
    REQUIRE(client.is_connected() == false);

    auto after = client.call("ping");
    REQUIRE(after.error().code == ClientErrorCode::NotConnected);
}

TEST_CASE("Abandoning stop does not wait for running handlers", "[server][lifecycle]") {
    auto server = start_test_server();
    RpcClient client;
    REQUIRE(client.connect(endpoint_of(*server)).has_value());

    auto pending = client.call_async("sleep", {{"ms", 800}});
    std::this_thread::sleep_for(50ms);
    REQUIRE(server->in_flight_requests() == 1);

    const auto started = std::chrono::steady_clock::now();
    server->stop(StopMode::Abandon);
    REQUIRE(std::chrono::steady_clock::now() - started < 400ms);
    REQUIRE(server->is_running() == false);

    auto result = pending.get();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ClientErrorCode::ConnectionLost);

    // Destruction waits for the abandoned handler and releases its request
    server.reset();
}

TEST_CASE("Disconnect fails calls in flight", "[client][lifecycle]") {
    auto server = start_test_server();
    RpcClient client;
    REQUIRE(client.connect(endpoint_of(*server)).has_value());

    auto pending = client.call_async("sleep", {{"ms", 300}});
    client.disconnect();

    auto result = pending.get();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ClientErrorCode::NotConnected);

    // A disconnected client can connect again
    REQUIRE(client.connect(endpoint_of(*server)).has_value());
    REQUIRE(client.call("ping").has_value());
}

TEST_CASE("wait_for_idle tracks running handlers", "[server][lifecycle]") {
    auto server = start_test_server();
    RpcClient client;
    REQUIRE(client.connect(endpoint_of(*server)).has_value());

    auto pending = client.call_async("sleep", {{"ms", 200}});
    std::this_thread::sleep_for(50ms);

    server->stop_accepting();
    REQUIRE(server->wait_for_idle(10ms) == false);
    REQUIRE(server->wait_for_idle(2s));

    // Existing connections keep working after the listener closes
    REQUIRE(pending.get().has_value());
    REQUIRE(client.call("ping").has_value());

    RpcClient latecomer(RpcClientConfig{}.with_connect_timeout(1s));
    REQUIRE_FALSE(latecomer.connect(endpoint_of(*server)).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Subprocess transport
// ═══════════════════════════════════════════════════════════════════════════

#ifndef _WIN32
TEST_CASE("Client talks to a subprocess over its stdio", "[client][subprocess]") {
    // Answers exactly one request, then exits
    SubprocessCommand command{
        "/bin/sh",
        {"-c", "read line; echo '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"pong\":true}}'"},
        std::nullopt,
        true
    };

    RpcClient client;
    REQUIRE(client.connect(command).has_value());

    auto pong = client.call("ping");
    REQUIRE(pong.has_value());
    REQUIRE((*pong)["pong"] == true);

    // EOF from the child ends the connection
    for (int i = 0; i < 100 && client.is_connected(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(client.is_connected() == false);
}

TEST_CASE("A missing executable is a connection failure", "[client][subprocess][error]") {
    RpcClient client;
    auto connected = client.connect(SubprocessCommand{"/nonexistent/devflow-service", {"--stdio"}, std::nullopt, true});
    REQUIRE_FALSE(connected.has_value());
    REQUIRE(connected.error().code == ClientErrorCode::ConnectionFailed);
}
#endif
