#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Service Runtime
// ═══════════════════════════════════════════════════════════════════════════
// Runs an RpcServer as a long-lived daemon. run() blocks until SIGINT or
// SIGTERM arrives, the stdio peer closes its end, or request_shutdown() is
// called; then it stops accepting, gives in-flight requests the grace period,
// stops the server and returns the process exit code. Handlers still running
// after the grace period are abandoned, not waited for.
//
//   ServiceRuntime runtime(config, PathResolver(PlatformProvider::detected()));
//   return runtime.run();

#include "devflow/platform/path_resolver.hpp"
#include "devflow/server/rpc_server.hpp"
#include "devflow/service/service_config.hpp"

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace devflow {

class ServiceRuntime {
public:
    /// Registers "ping" and the "system" group.
    ServiceRuntime(ServiceConfig config, PathResolver paths);
    ~ServiceRuntime();

    ServiceRuntime(const ServiceRuntime&) = delete;
    ServiceRuntime& operator=(const ServiceRuntime&) = delete;

    /// Additional methods, before run(). Gone once run() has abandoned
    /// requests.
    [[nodiscard]] RpcServer& server() noexcept { return *server_; }

    /// Requests still running when run() gave up on them. Their threads
    /// outlive run(); the process should exit without static destruction.
    [[nodiscard]] std::size_t abandoned_requests() const noexcept { return abandoned_; }

    /// Called from run() once the server is serving, with its TCP address
    /// (empty in stdio mode).
    void on_started(std::function<void(std::optional<ServerAddress>)> callback);

    /// 0 after a clean shutdown, 1 if the server could not start.
    [[nodiscard]] int run();

    /// Thread-safe; may be called before or during run().
    void request_shutdown();

    [[nodiscard]] const ServiceConfig& config() const noexcept { return config_; }

private:
    ServiceConfig config_;
    PathResolver paths_;
    std::unique_ptr<RpcServer> server_;
    std::function<void(std::optional<ServerAddress>)> started_callback_;

    asio::io_context control_;
    asio::signal_set signals_;
    std::atomic<bool> shutdown_requested_{false};
    std::size_t abandoned_{0};
};

/// systemd unit that runs `executable` with this configuration.
[[nodiscard]] std::string systemd_unit(const ServiceConfig& config, const std::filesystem::path& executable);

}  // namespace devflow
