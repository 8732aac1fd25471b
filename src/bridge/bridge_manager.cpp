#include "devflow/bridge/bridge_manager.hpp"
#include "devflow/log/logger.hpp"

namespace devflow {

BridgeManager::BridgeManager(PlatformProvider platform, BridgeOptions options, BridgeEndpointStore store,
                             RpcClientConfig client_config)
    : platform_(platform)
    , options_(std::move(options))
    , store_(std::move(store))
    , mode_(select_bridge_mode(platform_, options_.mode_override))
    , client_(std::make_unique<RpcClient>(std::move(client_config)))
{
    DEVFLOW_LOG_DEBUG("Bridge mode {} selected on {}", to_string(mode_), platform_.name());

    // The service can go away while nobody is calling.
    client_->on_connection_lost([this](const ClientError& error) {
        if (state() == BridgeState::Running) {
            transition(BridgeState::Error, error.message);
        }
    });
}

BridgeManager::~BridgeManager() {
    client_->on_connection_lost(nullptr);
    client_->disconnect();
    // Joins the client's I/O thread while the state members are still alive.
    client_.reset();
}

void BridgeManager::on_state_change(StateCallback callback) {
    std::lock_guard lock(mutex_);
    callback_ = std::move(callback);
}

BridgeState BridgeManager::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::optional<std::string> BridgeManager::last_error() const {
    std::lock_guard lock(mutex_);
    return last_error_;
}

std::optional<TransportDescriptor> BridgeManager::transport() const {
    std::lock_guard lock(mutex_);
    return transport_;
}

void BridgeManager::transition(BridgeState next, std::string detail) {
    StateCallback callback;
    {
        std::lock_guard lock(mutex_);
        if (state_ == next) {
            return;
        }
        state_ = next;
        if (next == BridgeState::Error) {
            last_error_ = detail;
        }
        callback = callback_;
    }

    if (next == BridgeState::Error) {
        DEVFLOW_LOG_WARN("Bridge error: {}", detail);
    } else {
        DEVFLOW_LOG_INFO("Bridge {}", to_string(next));
    }
    if (callback) {
        callback(next, detail);
    }
}

ClientError BridgeManager::fail_start(ClientError error) {
    client_->disconnect();
    transition(BridgeState::Error, error.message);
    return error;
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

ClientResult<void> BridgeManager::start() {
    std::lock_guard lifecycle(lifecycle_mutex_);

    if (state() == BridgeState::Running && client_->is_connected()) {
        return {};
    }
    client_->disconnect();
    transition(BridgeState::Starting);

    auto descriptor = resolve_bridge_transport(mode_, options_, store_);
    if (!descriptor) {
        return tl::unexpected(fail_start(ClientError::connection_failed(descriptor.error().message)));
    }
    {
        std::lock_guard lock(mutex_);
        transport_ = *descriptor;
    }

    if (auto connected = client_->connect(*descriptor); !connected) {
        return tl::unexpected(fail_start(connected.error()));
    }

    auto pong = client_->call("ping");
    if (!pong) {
        return tl::unexpected(fail_start(pong.error()));
    }
    if (pong->is_object() == false || pong->value("pong", false) == false) {
        return tl::unexpected(fail_start(ClientError::protocol_error(
            "Unexpected ping reply: " + pong->dump())));
    }

    transition(BridgeState::Running);
    return {};
}

void BridgeManager::stop() {
    std::lock_guard lifecycle(lifecycle_mutex_);
    client_->disconnect();
    transition(BridgeState::Stopped);
}

ClientResult<Json> BridgeManager::call(std::string_view method, Json params) {
    if (state() != BridgeState::Running) {
        return tl::unexpected(ClientError::not_connected());
    }

    auto result = client_->call(method, std::move(params));
    if (!result) {
        // NotConnected is also what a concurrent stop() produces; only treat
        // it as a failure while the bridge still believes it is up.
        const auto code = result.error().code;
        const bool lost = code == ClientErrorCode::ConnectionLost
            || (code == ClientErrorCode::NotConnected && state() == BridgeState::Running);
        if (lost) {
            transition(BridgeState::Error, result.error().message);
        }
    }
    return result;
}

}  // namespace devflow
