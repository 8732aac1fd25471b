#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Bridge Manager
// ═══════════════════════════════════════════════════════════════════════════
// Owns the RpcClient the UI talks through and the bridge state machine:
//
//   Stopped --start()--> Starting --connected + ping--> Running
//      ^                    |                             |
//      |                    +------ failure ----> Error <-+ connection lost
//      +------------------- stop() (from any state) ------+
//
// State changes are reported through the callback, outside the manager's
// lock, on the thread that caused them. A connection lost while idle is
// reported from the client's I/O thread; the callback must not call() from
// there.

#include "devflow/bridge/bridge_mode.hpp"
#include "devflow/client/rpc_client.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace devflow {

enum class BridgeState {
    Stopped,
    Starting,
    Running,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(BridgeState state) noexcept {
    switch (state) {
        case BridgeState::Stopped:  return "stopped";
        case BridgeState::Starting: return "starting";
        case BridgeState::Running:  return "running";
        case BridgeState::Error:    return "error";
    }
    return "unknown";
}

class BridgeManager {
public:
    /// (new state, detail). Detail carries the error message for Error.
    using StateCallback = std::function<void(BridgeState, const std::string&)>;

    BridgeManager(PlatformProvider platform, BridgeOptions options, BridgeEndpointStore store,
                  RpcClientConfig client_config = {});
    ~BridgeManager();

    BridgeManager(const BridgeManager&) = delete;
    BridgeManager& operator=(const BridgeManager&) = delete;

    void on_state_change(StateCallback callback);

    /// Connect with the selected transport and verify with "ping".
    /// No-op when already Running.
    ClientResult<void> start();

    /// Disconnect and return to Stopped.
    void stop();

    /// Requires Running. A lost connection moves the bridge to Error.
    [[nodiscard]] ClientResult<Json> call(std::string_view method, Json params = Json::object());

    [[nodiscard]] BridgeState state() const;
    [[nodiscard]] BridgeMode mode() const noexcept { return mode_; }
    [[nodiscard]] std::optional<std::string> last_error() const;

    /// Transport of the last start(), if any.
    [[nodiscard]] std::optional<TransportDescriptor> transport() const;

private:
    void transition(BridgeState next, std::string detail = {});
    ClientError fail_start(ClientError error);

    PlatformProvider platform_;
    BridgeOptions options_;
    BridgeEndpointStore store_;
    BridgeMode mode_;
    std::unique_ptr<RpcClient> client_;

    std::mutex lifecycle_mutex_;  // serialises start() and stop()

    mutable std::mutex mutex_;
    BridgeState state_{BridgeState::Stopped};
    std::optional<std::string> last_error_;
    std::optional<TransportDescriptor> transport_;
    StateCallback callback_;
};

}  // namespace devflow
