#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Service Configuration
// ═══════════════════════════════════════════════════════════════════════════
// Layers, lowest to highest precedence:
//
//   1. defaults below
//   2. JSON file (--config, else <DevflowHome>/service.json if present)
//   3. environment: DEVFLOW_SERVICE_HOST, DEVFLOW_SERVICE_PORT, DEVFLOW_LOG_LEVEL
//   4. command line (ServiceOverrides, filled by devflow-service)
//
// service.json keys mirror the struct: host, port, stdio, grace_period_ms,
// handler_threads, dispatch ("concurrent" | "sequential"), max_frame_size,
// log_level, log_file. Unknown keys are ignored.

#include "devflow/config/config_error.hpp"
#include "devflow/log/logger.hpp"
#include "devflow/platform/path_resolver.hpp"
#include "devflow/server/rpc_server.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace devflow {

struct ServiceConfig {
    std::string host{kDefaultServiceHost};
    std::uint16_t port{kDefaultServicePort};
    bool stdio{false};

    /// How long in-flight requests get after a shutdown request.
    std::chrono::milliseconds grace_period{std::chrono::seconds(5)};

    std::size_t handler_threads{4};
    DispatchMode dispatch{DispatchMode::Concurrent};
    std::size_t max_frame_size{kDefaultMaxFrameSize};

    LogLevel log_level{LogLevel::Info};
    std::optional<std::filesystem::path> log_file{};

    [[nodiscard]] RpcServerConfig server_config() const;
};

/// Command-line layer. Unset members leave the lower layers alone.
struct ServiceOverrides {
    std::optional<std::string> host;
    std::optional<std::uint16_t> port;
    std::optional<bool> stdio;
    std::optional<std::chrono::milliseconds> grace_period;
    std::optional<LogLevel> log_level;
    std::optional<std::filesystem::path> log_file;
};

ConfigResult<void> apply_json(ServiceConfig& config, const Json& document, const std::filesystem::path& source);
ConfigResult<void> apply_environment(ServiceConfig& config, const EnvironmentLookup& env);
void apply_overrides(ServiceConfig& config, const ServiceOverrides& overrides);

/// Defaults, then the file, then the environment. An explicit file that
/// does not exist is an error; the default location is optional.
[[nodiscard]] ConfigResult<ServiceConfig> load_service_config(
    const PathResolver& paths,
    const std::optional<std::filesystem::path>& explicit_file = std::nullopt,
    const EnvironmentLookup& env = process_environment()
);

[[nodiscard]] std::optional<DispatchMode> parse_dispatch_mode(std::string_view text);

}  // namespace devflow
