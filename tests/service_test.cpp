// ─────────────────────────────────────────────────────────────────────────────
// Service Tests
// ─────────────────────────────────────────────────────────────────────────────
// Configuration layering, the built-in "system" methods, and ServiceRuntime
// running a real server on an OS-assigned port.

#include <catch2/catch_test_macros.hpp>

#include "devflow/client/rpc_client.hpp"
#include "devflow/log/logger.hpp"
#include "devflow/server/dispatcher.hpp"
#include "devflow/service/service_config.hpp"
#include "devflow/service/service_runtime.hpp"
#include "devflow/service/system_handlers.hpp"
#include "devflow/version.hpp"

#include "mocks/temp_dir.hpp"
#include "mocks/test_handlers.hpp"

#include <chrono>
#include <csignal>
#include <future>
#include <map>
#include <set>
#include <thread>

#ifndef _WIN32
#include <unistd.h>
#endif

using namespace devflow;
using namespace devflow::testing;
using namespace std::chrono_literals;

namespace {

using Vars = std::map<std::string, std::string, std::less<>>;

EnvironmentLookup fake_env(Vars vars) {
    return [vars = std::move(vars)](std::string_view name) -> std::optional<std::string> {
        const auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

PathResolver home_at(const std::filesystem::path& home) {
    return PathResolver(PlatformProvider(Platform::Linux), fake_env({{"HOME", home.string()}}));
}

Json call_system(const PathResolver& paths, std::string method, Json params = Json::object()) {
    HandlerRegistry registry;
    REQUIRE(registry.add_group("system", system_handlers(paths)).has_value());
    auto response = Dispatcher(registry).dispatch(JsonRpcRequest(std::move(method), 1, std::move(params)).to_json());
    return response.to_json();
}

// Runs a ServiceRuntime on a background thread until shut down.
class RunningService {
public:
    explicit RunningService(ServiceConfig config)
        : runtime_(std::move(config), PathResolver(PlatformProvider::detected()))
    {
        REQUIRE(runtime_.server().register_group("", test_methods()).has_value());
        runtime_.on_started([this](std::optional<ServerAddress> address) {
            started_.set_value(address);
        });
        exit_code_ = std::async(std::launch::async, [this] { return runtime_.run(); });

        auto started = started_.get_future();
        REQUIRE(started.wait_for(5s) == std::future_status::ready);
        address_ = started.get();
        REQUIRE(address_.has_value());
    }

    ~RunningService() {
        if (exit_code_.valid()) {
            runtime_.request_shutdown();
            exit_code_.wait();
        }
    }

    [[nodiscard]] TcpEndpoint endpoint() const { return TcpEndpoint{address_->host, address_->port}; }
    [[nodiscard]] ServiceRuntime& runtime() { return runtime_; }

    int shutdown() {
        runtime_.request_shutdown();
        return exit_code_.get();
    }

    /// Exit code once run() returns on its own, or nullopt after `timeout`.
    std::optional<int> wait_for_exit(std::chrono::milliseconds timeout) {
        if (exit_code_.wait_for(timeout) != std::future_status::ready) {
            return std::nullopt;
        }
        return exit_code_.get();
    }

private:
    ServiceRuntime runtime_;
    std::promise<std::optional<ServerAddress>> started_;
    std::future<int> exit_code_;
    std::optional<ServerAddress> address_;
};

ServiceConfig any_port_config() {
    ServiceConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    return config;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Service defaults", "[service][config]") {
    ServiceConfig config;
    REQUIRE(config.host == "127.0.0.1");
    REQUIRE(config.port == 9876);
    REQUIRE(config.stdio == false);
    REQUIRE(config.grace_period == 5s);
    REQUIRE(config.log_level == LogLevel::Info);

    const auto server = config.server_config();
    const auto* tcp = std::get_if<TcpListenEndpoint>(&server.endpoint);
    REQUIRE(tcp != nullptr);
    REQUIRE(tcp->port == 9876);
    REQUIRE(server.dispatch == DispatchMode::Concurrent);

    config.stdio = true;
    REQUIRE(std::holds_alternative<StdioEndpoint>(config.server_config().endpoint));
}

TEST_CASE("service.json is applied over the defaults", "[service][config]") {
    ServiceConfig config;
    auto applied = apply_json(config, {
        {"host", "0.0.0.0"},
        {"port", 7000},
        {"grace_period_ms", 1500},
        {"handler_threads", 8},
        {"dispatch", "sequential"},
        {"max_frame_size", 4096},
        {"log_level", "debug"},
        {"log_file", "/var/log/devflow.log"},
        {"unknown_key", true}
    }, "service.json");

    REQUIRE(applied.has_value());
    REQUIRE(config.host == "0.0.0.0");
    REQUIRE(config.port == 7000);
    REQUIRE(config.grace_period == 1500ms);
    REQUIRE(config.handler_threads == 8);
    REQUIRE(config.dispatch == DispatchMode::Sequential);
    REQUIRE(config.server_config().transport.max_frame_size == 4096);
    REQUIRE(config.log_level == LogLevel::Debug);
    REQUIRE(config.log_file == std::filesystem::path("/var/log/devflow.log"));
}

TEST_CASE("A bad key leaves the configuration untouched", "[service][config][error]") {
    ServiceConfig config;

    SECTION("Port out of range") {
        auto applied = apply_json(config, {{"host", "0.0.0.0"}, {"port", 70000}}, "service.json");
        REQUIRE_FALSE(applied.has_value());
        REQUIRE(applied.error().code == ConfigError::Code::Malformed);
    }

    SECTION("Wrong type") {
        REQUIRE_FALSE(apply_json(config, {{"host", "0.0.0.0"}, {"stdio", "yes"}}, "service.json").has_value());
    }

    SECTION("Unknown dispatch mode") {
        REQUIRE_FALSE(apply_json(config, {{"host", "0.0.0.0"}, {"dispatch", "parallel"}}, "service.json").has_value());
    }

    SECTION("Not an object") {
        REQUIRE_FALSE(apply_json(config, Json::array(), "service.json").has_value());
    }

    REQUIRE(config.host == "127.0.0.1");
}

TEST_CASE("Environment overrides the file", "[service][config][env]") {
    ServiceConfig config;

    SECTION("Valid values") {
        auto applied = apply_environment(config, fake_env({
            {"DEVFLOW_SERVICE_HOST", "0.0.0.0"},
            {"DEVFLOW_SERVICE_PORT", "9000"},
            {"DEVFLOW_LOG_LEVEL", "warn"}
        }));
        REQUIRE(applied.has_value());
        REQUIRE(config.host == "0.0.0.0");
        REQUIRE(config.port == 9000);
        REQUIRE(config.log_level == LogLevel::Warn);
    }

    SECTION("Empty values are ignored") {
        REQUIRE(apply_environment(config, fake_env({{"DEVFLOW_SERVICE_PORT", ""}})).has_value());
        REQUIRE(config.port == 9876);
    }

    SECTION("Port 0 and 65535 are accepted like in service.json") {
        REQUIRE(apply_environment(config, fake_env({{"DEVFLOW_SERVICE_PORT", "0"}})).has_value());
        REQUIRE(config.port == 0);

        REQUIRE(apply_environment(config, fake_env({{"DEVFLOW_SERVICE_PORT", "65535"}})).has_value());
        REQUIRE(config.port == 65535);

        ServiceConfig from_file;
        REQUIRE(apply_json(from_file, {{"port", 0}}, "service.json").has_value());
        REQUIRE(from_file.port == 0);
    }

    SECTION("Invalid values are errors") {
        for (const char* port : {"65536", "12ab", "-1", " 80"}) {
            ServiceConfig fresh;
            auto applied = apply_environment(fresh, fake_env({{"DEVFLOW_SERVICE_PORT", port}}));
            REQUIRE_FALSE(applied.has_value());
            REQUIRE(applied.error().code == ConfigError::Code::InvalidValue);
            REQUIRE(fresh.port == 9876);
        }

        auto level = apply_environment(config, fake_env({{"DEVFLOW_LOG_LEVEL", "loud"}}));
        REQUIRE(level.error().code == ConfigError::Code::InvalidValue);
    }
}

TEST_CASE("Command line wins over everything", "[service][config]") {
    ServiceConfig config;
    config.port = 7000;

    ServiceOverrides overrides;
    overrides.port = 0;
    overrides.grace_period = 250ms;
    apply_overrides(config, overrides);

    REQUIRE(config.port == 0);
    REQUIRE(config.grace_period == 250ms);
    REQUIRE(config.host == "127.0.0.1");
}

TEST_CASE("load_service_config layers file and environment", "[service][config]") {
    TempDir home;

    SECTION("No file at the default location") {
        auto loaded = load_service_config(home_at(home.path()), std::nullopt, fake_env({}));
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->port == 9876);
    }

    SECTION("Default location") {
        home.write(".devflow/service.json", R"({"port": 7100, "log_level": "debug"})");
        auto loaded = load_service_config(home_at(home.path()), std::nullopt,
                                          fake_env({{"DEVFLOW_LOG_LEVEL", "error"}}));
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->port == 7100);
        REQUIRE(loaded->log_level == LogLevel::Error);
    }

    SECTION("Explicit file") {
        home.write("custom.json", R"({"host": "0.0.0.0"})");
        auto loaded = load_service_config(home_at(home.path()), home / "custom.json", fake_env({}));
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->host == "0.0.0.0");
    }

    SECTION("A missing explicit file is an error") {
        auto loaded = load_service_config(home_at(home.path()), home / "absent.json", fake_env({}));
        REQUIRE_FALSE(loaded.has_value());
        REQUIRE(loaded.error().code == ConfigError::Code::Unreadable);
    }

    SECTION("A malformed file is an error") {
        home.write(".devflow/service.json", "{ port: 1 ");
        auto loaded = load_service_config(home_at(home.path()), std::nullopt, fake_env({}));
        REQUIRE(loaded.error().code == ConfigError::Code::Malformed);
    }

    SECTION("No home directory still yields defaults") {
        PathResolver no_home(PlatformProvider(Platform::Windows), fake_env({}));
        auto loaded = load_service_config(no_home, std::nullopt, fake_env({{"DEVFLOW_SERVICE_PORT", "9100"}}));
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->port == 9100);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// System methods
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("system.ping and system.version", "[service][system]") {
    auto paths = home_at("/home/dev");

    const Json ping = call_system(paths, "system.ping");
    REQUIRE(ping["result"]["pong"] == true);
    REQUIRE(ping["result"]["version"] == std::string(kVersion));

    const Json version = call_system(paths, "system.version");
    REQUIRE(version["result"]["devflow"] == std::string(kVersion));
    REQUIRE(version["result"]["platform"] == "linux");
    REQUIRE(version["result"]["compiler"].is_string());
}

TEST_CASE("system.info describes the host", "[service][system]") {
    const Json info = call_system(home_at("/home/dev"), "system.info");
    REQUIRE(info["result"]["platform"] == "linux");
    REQUIRE(info["result"]["home_dir"] == "/home/dev");
    REQUIRE(info["result"]["config_dir"] == "/home/dev/.devflow");
    REQUIRE(info["result"]["pid"].is_number_integer());

    SECTION("Without a home directory") {
        PathResolver no_home(PlatformProvider(Platform::Windows), fake_env({}));
        const Json partial = call_system(no_home, "system.info");
        REQUIRE(partial["result"]["platform"] == "windows");
        REQUIRE(partial["result"]["home_dir"].is_null());
        REQUIRE(partial["result"].contains("warning"));
    }
}

TEST_CASE("system.paths resolves every resource", "[service][system]") {
    const Json paths = call_system(home_at("/home/dev"), "system.paths", {{"mount_target", "/docker.sock"}});
    const Json& result = paths["result"];

    REQUIRE(result.size() == 7);
    REQUIRE(result["docker_socket"] == "/var/run/docker.sock");
    REQUIRE(result["hosts_file"] == "/etc/hosts");
    REQUIRE(result["ssh_dir"] == "/home/dev/.ssh");
    REQUIRE(result["socket_mount"] == "/var/run/docker.sock:/docker.sock");

    SECTION("Bad parameter type") {
        const Json bad = call_system(home_at("/home/dev"), "system.paths", {{"mount_target", 5}});
        REQUIRE(bad["error"]["code"] == -32602);
    }
}

TEST_CASE("system.tools reports binaries found on PATH", "[service][system]") {
    PathResolver paths(
        PlatformProvider(Platform::Linux),
        fake_env({{"HOME", "/home/dev"}, {"PATH", "/usr/bin"}}),
        [](const std::filesystem::path& p) { return p.generic_string() == "/usr/bin/docker"; });

    const Json tools = call_system(paths, "system.tools");
    REQUIRE(tools["result"].is_array());
    REQUIRE(tools["result"].size() == 6);

    for (const auto& tool : tools["result"]) {
        if (tool["name"] == "docker") {
            REQUIRE(tool["path"] == "/usr/bin/docker");
        } else {
            REQUIRE(tool["path"].is_null());
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Runtime
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ServiceRuntime serves until shutdown is requested", "[service][runtime]") {
    RunningService service(any_port_config());

    RpcClient client;
    REQUIRE(client.connect(service.endpoint()).has_value());

    REQUIRE(client.call("ping").has_value());
    auto info = client.call("system.info");
    REQUIRE(info.has_value());
    REQUIRE((*info)["version"] == std::string(kVersion));
    REQUIRE((*client.call("add", {{"a", 2}, {"b", 2}}))["result"] == 4);

    REQUIRE(service.shutdown() == 0);
}

TEST_CASE("In-flight requests finish within the grace period", "[service][runtime][shutdown]") {
    RunningService service(any_port_config());

    RpcClient client;
    REQUIRE(client.connect(service.endpoint()).has_value());

    auto pending = client.call_async("sleep", {{"ms", 200}});
    std::this_thread::sleep_for(50ms);

    REQUIRE(service.shutdown() == 0);

    auto result = pending.get();
    REQUIRE(result.has_value());
    REQUIRE((*result)["slept"] == 200);
}

TEST_CASE("Requests past the grace period are cut off", "[service][runtime][shutdown]") {
    auto config = any_port_config();
    config.grace_period = 50ms;
    RunningService service(config);

    RpcClient client;
    REQUIRE(client.connect(service.endpoint()).has_value());

    auto pending = client.call_async("sleep", {{"ms", 600}});
    std::this_thread::sleep_for(50ms);

    REQUIRE(service.shutdown() == 0);

    auto result = pending.get();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ClientErrorCode::ConnectionLost);
}

TEST_CASE("A stuck handler does not hold up shutdown", "[service][runtime][shutdown]") {
    auto config = any_port_config();
    config.grace_period = 50ms;
    RunningService service(config);

    RpcClient client;
    REQUIRE(client.connect(service.endpoint()).has_value());

    auto pending = client.call_async("sleep", {{"ms", 5000}});
    std::this_thread::sleep_for(50ms);
    REQUIRE(service.runtime().server().in_flight_requests() == 1);

    const auto started = std::chrono::steady_clock::now();
    REQUIRE(service.shutdown() == 0);
    REQUIRE(std::chrono::steady_clock::now() - started < 2s);
    REQUIRE(service.runtime().abandoned_requests() == 1);

    auto result = pending.get();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ClientErrorCode::ConnectionLost);
}

#ifndef _WIN32
TEST_CASE("SIGTERM drains and exits cleanly", "[service][runtime][signal]") {
    auto recorder = std::make_unique<RecordingLogger>(LogLevel::Info);
    auto* log = recorder.get();
    set_logger(std::move(recorder));

    {
        RunningService service(any_port_config());

        RpcClient client;
        REQUIRE(client.connect(service.endpoint()).has_value());

        auto pending = client.call_async("sleep", {{"ms", 200}});
        std::this_thread::sleep_for(50ms);

        REQUIRE(::kill(::getpid(), SIGTERM) == 0);

        const auto exit_code = service.wait_for_exit(5s);
        REQUIRE(exit_code.has_value());
        REQUIRE(*exit_code == 0);

        auto result = pending.get();
        REQUIRE(result.has_value());
        REQUIRE((*result)["slept"] == 200);
        REQUIRE(service.runtime().abandoned_requests() == 0);
    }

    REQUIRE(log->contains(LogLevel::Info, "Shutting down (SIGTERM)"));
    set_logger(nullptr);
}
#endif

TEST_CASE("Shutdown requested before run() returns promptly", "[service][runtime]") {
    ServiceRuntime runtime(any_port_config(), PathResolver(PlatformProvider::detected()));
    runtime.request_shutdown();

    auto exit_code = std::async(std::launch::async, [&runtime] { return runtime.run(); });
    REQUIRE(exit_code.wait_for(5s) == std::future_status::ready);
    REQUIRE(exit_code.get() == 0);
}

TEST_CASE("A port in use makes run() fail", "[service][runtime][error]") {
    RunningService first(any_port_config());

    auto config = any_port_config();
    config.port = first.endpoint().port;
    ServiceRuntime second(config, PathResolver(PlatformProvider::detected()));
    REQUIRE(second.run() == 1);
}

TEST_CASE("systemd unit carries the configuration", "[service][systemd]") {
    ServiceConfig config;
    config.port = 9000;
    config.grace_period = 3s;
    config.log_level = LogLevel::Debug;
    config.log_file = "/var/log/devflow.log";

    const std::string unit = systemd_unit(config, "/usr/local/bin/devflow-service");

    REQUIRE(unit.find("[Unit]") != std::string::npos);
    REQUIRE(unit.find("[Install]") != std::string::npos);
    REQUIRE(unit.find("ExecStart=/usr/local/bin/devflow-service --host 127.0.0.1 --port 9000 "
                      "--grace-period 3000 --log-level debug --log-file /var/log/devflow.log\n")
            != std::string::npos);
    REQUIRE(unit.find("KillSignal=SIGTERM") != std::string::npos);
    REQUIRE(unit.find("TimeoutStopSec=8") != std::string::npos);
}
