// ─────────────────────────────────────────────────────────────────────────────
// devflow-service - control-plane daemon
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   devflow-service                        # TCP on 127.0.0.1:9876
//   devflow-service --port 0               # any free port (logged)
//   devflow-service --stdio                # one client over stdin/stdout
//   devflow-service --print-systemd-unit > ~/.config/systemd/user/devflow.service
//
// Logs go to stderr (stdout carries the protocol in --stdio mode).

#include <cxxopts.hpp>

#include "devflow/log/logger.hpp"
#include "devflow/log/spdlog_logger.hpp"
#include "devflow/platform/path_resolver.hpp"
#include "devflow/platform/platform.hpp"
#include "devflow/service/service_config.hpp"
#include "devflow/service/service_runtime.hpp"
#include "devflow/version.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

using namespace devflow;

namespace {

void print_error(const std::string& message) {
    std::cerr << "devflow-service: " << message << "\n";
}

std::filesystem::path self_path(const char* argv0) {
    std::error_code ec;
    auto resolved = std::filesystem::canonical("/proc/self/exe", ec);
    if (!ec) {
        return resolved;
    }
    return std::filesystem::absolute(argv0, ec);
}

}  // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("devflow-service", "devflow control-plane service");

    options.add_options()
        ("host", "Address to listen on", cxxopts::value<std::string>())
        ("p,port", "TCP port (0 = any free port)", cxxopts::value<unsigned>())
        ("stdio", "Serve a single client over stdin/stdout")
        ("grace-period", "Milliseconds in-flight requests get at shutdown", cxxopts::value<unsigned>())
        ("c,config", "Configuration file (default: <devflow home>/service.json)", cxxopts::value<std::string>())
        ("log-level", "trace, debug, info, warn, error, off", cxxopts::value<std::string>())
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("print-systemd-unit", "Print a systemd unit for this configuration and exit")
        ("version", "Print the version")
        ("h,help", "Print usage");

    ServiceOverrides overrides;
    std::optional<std::filesystem::path> config_file;
    bool print_unit = false;

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Environment:\n"
                      << "  DEVFLOW_SERVICE_HOST, DEVFLOW_SERVICE_PORT, DEVFLOW_LOG_LEVEL\n";
            return 0;
        }
        if (result.count("version")) {
            std::cout << kVersion << "\n";
            return 0;
        }

        if (result.count("host")) {
            overrides.host = result["host"].as<std::string>();
        }
        if (result.count("port")) {
            const unsigned port = result["port"].as<unsigned>();
            if (port > 65535) {
                print_error("--port must be between 0 and 65535");
                return 1;
            }
            overrides.port = static_cast<std::uint16_t>(port);
        }
        if (result.count("stdio")) {
            overrides.stdio = true;
        }
        if (result.count("grace-period")) {
            overrides.grace_period = std::chrono::milliseconds(result["grace-period"].as<unsigned>());
        }
        if (result.count("log-level")) {
            const auto text = result["log-level"].as<std::string>();
            overrides.log_level = parse_log_level(text);
            if (!overrides.log_level) {
                print_error("unknown log level '" + text + "'");
                return 1;
            }
        }
        if (result.count("log-file")) {
            overrides.log_file = std::filesystem::path(result["log-file"].as<std::string>());
        }
        if (result.count("config")) {
            config_file = std::filesystem::path(result["config"].as<std::string>());
        }
        print_unit = result.count("print-systemd-unit") > 0;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }

    // Platform first: an unknown OS must stop the service before it binds.
    std::optional<PathResolver> paths;
    try {
        paths.emplace(PlatformProvider::detected());
    } catch (const UnsupportedPlatformError& e) {
        print_error(e.what());
        return 1;
    }

    auto loaded = load_service_config(*paths, config_file);
    if (!loaded) {
        print_error(loaded.error().message);
        return 1;
    }
    ServiceConfig config = std::move(*loaded);
    apply_overrides(config, overrides);

    if (print_unit) {
        std::cout << systemd_unit(config, self_path(argv[0]));
        return 0;
    }

    try {
        set_logger(make_spdlog_logger(LogSinkConfig{config.log_level, true, config.log_file}));
    } catch (const std::exception& e) {
        print_error(std::string("cannot set up logging: ") + e.what());
        return 1;
    }

    ServiceRuntime runtime(std::move(config), std::move(*paths));
    runtime.on_started([](std::optional<ServerAddress> address) {
        if (address) {
            DEVFLOW_LOG_INFO("Ready on {}:{}", address->host, address->port);
        } else {
            DEVFLOW_LOG_INFO("Ready on stdio");
        }
    });

    const int code = runtime.run();
    set_logger(nullptr);
    if (runtime.abandoned_requests() > 0) {
        // Abandoned handler threads may still touch globals.
        std::quick_exit(code);
    }
    return code;
}
