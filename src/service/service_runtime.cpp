#include "devflow/service/service_runtime.hpp"
#include "devflow/log/logger.hpp"
#include "devflow/service/system_handlers.hpp"
#include "devflow/version.hpp"

#include <asio/post.hpp>

#include <csignal>
#include <sstream>
#include <stdexcept>

namespace devflow {

ServiceRuntime::ServiceRuntime(ServiceConfig config, PathResolver paths)
    : config_(std::move(config))
    , paths_(std::move(paths))
    , server_(std::make_unique<RpcServer>(config_.server_config()))
    , signals_(control_)
{
    auto registered = server_->register_group("system", system_handlers(paths_));
    if (!registered) {
        throw std::logic_error(registered.error().message);
    }

    // The stdio peer going away ends the service.
    server_->on_closed([this] {
        DEVFLOW_LOG_INFO("Input closed");
        request_shutdown();
    });
}

ServiceRuntime::~ServiceRuntime() = default;

void ServiceRuntime::on_started(std::function<void(std::optional<ServerAddress>)> callback) {
    started_callback_ = std::move(callback);
}

void ServiceRuntime::request_shutdown() {
    if (shutdown_requested_.exchange(true)) {
        return;
    }
    asio::post(control_, [this] {
        asio::error_code ignored;
        signals_.cancel(ignored);
    });
}

int ServiceRuntime::run() {
    DEVFLOW_LOG_INFO("devflow-service {} starting on {}", kVersion, paths_.platform().name());

    auto started = server_->start();
    if (!started) {
        DEVFLOW_LOG_ERROR("Cannot start service: {}", started.error().message);
        return 1;
    }

    // Installed before anyone learns the service is up, so a SIGTERM sent
    // right after start still drains.
    asio::error_code ec;
    signals_.add(SIGINT, ec);
    if (!ec) {
        signals_.add(SIGTERM, ec);
    }
    if (ec) {
        DEVFLOW_LOG_WARN("Cannot install signal handlers: {}", ec.message());
    }

    if (started_callback_) {
        started_callback_(server_->address());
    }

    std::string reason = "shutdown requested";
    signals_.async_wait([&reason](const asio::error_code& wait_ec, int signal_number) {
        if (!wait_ec) {
            reason = signal_number == SIGINT ? "SIGINT" : "SIGTERM";
        }
    });
    control_.run();

    DEVFLOW_LOG_INFO("Shutting down ({})", reason);
    server_->stop_accepting();
    if (server_->wait_for_idle(config_.grace_period)) {
        server_->stop();
    } else {
        abandoned_ = server_->in_flight_requests();
        DEVFLOW_LOG_WARN("{} request(s) still running after {}ms; abandoning them",
                         abandoned_, config_.grace_period.count());
        server_->stop(StopMode::Abandon);
        // Destroying the server would wait for those handlers; it stays
        // allocated until the process exits.
        static_cast<void>(server_.release());
    }

    signals_.clear(ec);
    DEVFLOW_LOG_INFO("Service stopped");
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// systemd
// ═══════════════════════════════════════════════════════════════════════════

std::string systemd_unit(const ServiceConfig& config, const std::filesystem::path& executable) {
    std::ostringstream unit;
    unit << "[Unit]\n"
         << "Description=devflow control-plane service\n"
         << "After=network.target docker.service\n"
         << "\n"
         << "[Service]\n"
         << "Type=simple\n"
         << "ExecStart=" << executable.generic_string()
         << " --host " << config.host
         << " --port " << config.port
         << " --grace-period " << config.grace_period.count()
         << " --log-level " << to_string(config.log_level);
    if (config.log_file) {
        unit << " --log-file " << config.log_file->generic_string();
    }
    unit << "\n"
         << "Restart=on-failure\n"
         << "RestartSec=2\n"
         << "KillSignal=SIGTERM\n"
         << "TimeoutStopSec=" << (config.grace_period.count() / 1000 + 5) << "\n"
         << "\n"
         << "[Install]\n"
         << "WantedBy=default.target\n";
    return unit.str();
}

}  // namespace devflow
