// ─────────────────────────────────────────────────────────────────────────────
// devflow-cli - bridge testing tool
// ─────────────────────────────────────────────────────────────────────────────
// Connects to the devflow service the way the UI does and calls one method.
//
// Usage:
//   devflow-cli --ping                                  # platform-default bridge
//   devflow-cli --mode tcp --host 127.0.0.1 --port 9876 --call system.info
//   devflow-cli --mode subprocess --service ./devflow-service --call system.paths
//   devflow-cli --call add --params '{"a": 5, "b": 3}' --json

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "devflow/bridge/bridge_manager.hpp"
#include "devflow/log/logger.hpp"
#include "devflow/log/spdlog_logger.hpp"
#include "devflow/platform/path_resolver.hpp"
#include "devflow/platform/platform.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace devflow;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset = "\033[0m";
    const char* bold  = "\033[1m";
    const char* dim   = "\033[2m";
    const char* red   = "\033[31m";
    const char* green = "\033[32m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

namespace {

void print_error(const std::string& message) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << message << "\n";
}

void print_client_error(const ClientError& error, bool json_output) {
    if (json_output) {
        Json out = {
            {"ok", false},
            {"code", std::string(to_string(error.code))},
            {"message", error.message}
        };
        if (error.rpc_error) {
            out["error"] = error.rpc_error->to_json();
        }
        std::cout << out.dump(2) << "\n";
        return;
    }
    print_error(std::string(to_string(error.code)) + ": " + error.message);
    if (error.rpc_error) {
        std::cerr << color::c(color::dim) << "  rpc code " << error.rpc_error->code;
        if (error.rpc_error->data) {
            std::cerr << ", data " << error.rpc_error->data->dump();
        }
        std::cerr << color::c(color::reset) << "\n";
    }
}

int cmd_call(BridgeManager& bridge, const std::string& method, const Json& params, bool json_output) {
    const auto started = std::chrono::steady_clock::now();
    auto result = bridge.call(method, params);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (!result) {
        print_client_error(result.error(), json_output);
        return 1;
    }

    if (json_output) {
        std::cout << Json{{"ok", true}, {"result", *result}}.dump(2) << "\n";
    } else {
        std::cout << result->dump(2) << "\n";
        std::cout << color::c(color::dim) << method << " took " << elapsed.count() << "ms"
                  << color::c(color::reset) << "\n";
    }
    return 0;
}

int cmd_ping(BridgeManager& bridge, bool json_output) {
    const auto started = std::chrono::steady_clock::now();
    auto result = bridge.call("ping");
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (!result) {
        print_client_error(result.error(), json_output);
        return 1;
    }
    if (json_output) {
        std::cout << Json{{"ok", true}, {"latency_ms", elapsed.count()}}.dump(2) << "\n";
    } else {
        std::cout << color::c(color::green) << "pong" << color::c(color::reset)
                  << " (" << elapsed.count() << "ms)\n";
    }
    return 0;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("devflow-cli", "devflow bridge testing tool");

    options.add_options()
        ("m,mode", "Bridge mode: subprocess or tcp (default: by platform)", cxxopts::value<std::string>())
        ("host", "Service host (tcp mode)", cxxopts::value<std::string>())
        ("p,port", "Service port (tcp mode)", cxxopts::value<unsigned>())
        ("s,service", "Service executable (subprocess mode)", cxxopts::value<std::string>()->default_value("devflow-service"))
        ("a,args", "Extra arguments for the service executable", cxxopts::value<std::vector<std::string>>())
        ("state-file", "Where the tcp endpoint is remembered (default: <devflow home>/bridge.json)", cxxopts::value<std::string>())
        ("call", "Method to call", cxxopts::value<std::string>())
        ("params", "JSON params for --call", cxxopts::value<std::string>()->default_value("{}"))
        ("ping", "Ping the service")
        ("timeout", "Request timeout in milliseconds (0 = none)", cxxopts::value<unsigned>()->default_value("30000"))
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("v,verbose", "Enable verbose logging")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n"
                      << "  devflow-cli --ping\n"
                      << "  devflow-cli --mode tcp --port 9876 --call system.info\n"
                      << "  devflow-cli --mode subprocess --service ./devflow-service --call system.paths\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;

        if (result.count("verbose")) {
            set_logger(make_spdlog_logger(LogSinkConfig{LogLevel::Debug, true, std::nullopt}));
        }

        BridgeOptions bridge_options;
        if (result.count("mode")) {
            const auto text = result["mode"].as<std::string>();
            bridge_options.mode_override = parse_bridge_mode(text);
            if (!bridge_options.mode_override) {
                print_error("unknown mode '" + text + "' (expected subprocess or tcp)");
                return 1;
            }
        }
        if (result.count("host") || result.count("port")) {
            TcpEndpoint endpoint;
            if (result.count("host")) {
                endpoint.host = result["host"].as<std::string>();
            }
            if (result.count("port")) {
                const unsigned port = result["port"].as<unsigned>();
                if (port == 0 || port > 65535) {
                    print_error("--port must be between 1 and 65535");
                    return 1;
                }
                endpoint.port = static_cast<std::uint16_t>(port);
            }
            bridge_options.tcp_endpoint = endpoint;
        }

        bridge_options.service_command.command = result["service"].as<std::string>();
        bridge_options.service_command.args = {"--stdio"};
        if (result.count("args")) {
            for (const auto& arg : result["args"].as<std::vector<std::string>>()) {
                bridge_options.service_command.args.push_back(arg);
            }
        }

        Json params = Json::object();
        if (result.count("call")) {
            params = Json::parse(result["params"].as<std::string>(), nullptr, false);
            if (params.is_discarded()) {
                print_error("--params is not valid JSON");
                return 1;
            }
        } else if (!result.count("ping")) {
            print_error("Must specify --call <method> or --ping");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }

        const PlatformProvider platform = PlatformProvider::detected();
        PathResolver paths(platform);
        BridgeEndpointStore store = result.count("state-file")
            ? BridgeEndpointStore(paths.expand_path(result["state-file"].as<std::string>()))
            : BridgeEndpointStore::at_default_location(paths);

        RpcClientConfig client_config;
        client_config.with_request_timeout(std::chrono::milliseconds(result["timeout"].as<unsigned>()));

        BridgeManager bridge(platform, std::move(bridge_options), std::move(store), client_config);
        if (!json_output) {
            bridge.on_state_change([](BridgeState state, const std::string& detail) {
                std::cerr << color::c(color::dim) << "bridge: " << to_string(state);
                if (!detail.empty()) {
                    std::cerr << " (" << detail << ")";
                }
                std::cerr << color::c(color::reset) << "\n";
            });
            std::cerr << color::c(color::dim) << "mode: " << to_string(bridge.mode())
                      << " on " << platform.name() << color::c(color::reset) << "\n";
        }

        if (auto started = bridge.start(); !started) {
            print_client_error(started.error(), json_output);
            return 1;
        }

        int exit_code = 0;
        if (result.count("call")) {
            exit_code = cmd_call(bridge, result["call"].as<std::string>(), params, json_output);
        } else {
            exit_code = cmd_ping(bridge, json_output);
        }

        bridge.stop();
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const UnsupportedPlatformError& e) {
        print_error(e.what());
        return 1;
    } catch (const PathResolutionError& e) {
        print_error(e.what());
        return 1;
    }
}
