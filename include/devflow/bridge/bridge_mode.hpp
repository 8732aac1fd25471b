#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Bridge Mode Selection
// ═══════════════════════════════════════════════════════════════════════════
// How the UI side reaches the service:
//
//   Subprocess  spawn `devflow-service --stdio` and talk over its pipes
//               (Linux, macOS, WSL2)
//   Tcp         connect to a running daemon at host:port (Windows, where
//               the service lives inside WSL2 or a container)
//
// The Tcp endpoint is remembered in <DevflowHome>/bridge.json.

#include "devflow/client/rpc_client.hpp"
#include "devflow/config/config_error.hpp"
#include "devflow/platform/path_resolver.hpp"
#include "devflow/platform/platform.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace devflow {

enum class BridgeMode {
    Subprocess,
    Tcp
};

[[nodiscard]] constexpr std::string_view to_string(BridgeMode mode) noexcept {
    switch (mode) {
        case BridgeMode::Subprocess: return "subprocess";
        case BridgeMode::Tcp:        return "tcp";
    }
    return "unknown";
}

/// "subprocess" / "tcp", case-insensitive.
[[nodiscard]] std::optional<BridgeMode> parse_bridge_mode(std::string_view text);

/// Platform default unless `override_mode` is set.
[[nodiscard]] BridgeMode select_bridge_mode(const PlatformProvider& platform,
                                            std::optional<BridgeMode> override_mode = std::nullopt) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// BridgeEndpointStore
// ─────────────────────────────────────────────────────────────────────────────

class BridgeEndpointStore {
public:
    static constexpr std::string_view kFileName = "bridge.json";

    explicit BridgeEndpointStore(std::filesystem::path file)
        : file_(std::move(file))
    {}

    /// <DevflowHome>/bridge.json for the resolver's platform.
    [[nodiscard]] static BridgeEndpointStore at_default_location(const PathResolver& paths);

    [[nodiscard]] const std::filesystem::path& file() const noexcept { return file_; }

    /// Empty when nothing has been saved yet.
    [[nodiscard]] ConfigResult<std::optional<TcpEndpoint>> load() const;

    /// Creates the parent directory if needed.
    ConfigResult<void> save(const TcpEndpoint& endpoint) const;

private:
    std::filesystem::path file_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Transport resolution
// ─────────────────────────────────────────────────────────────────────────────

struct BridgeOptions {
    std::optional<BridgeMode> mode_override{};

    /// Tcp target for this run; also becomes the remembered endpoint.
    std::optional<TcpEndpoint> tcp_endpoint{};

    /// What Subprocess mode spawns.
    SubprocessCommand service_command{"devflow-service", {"--stdio"}};
};

/// Transport for `mode`. For Tcp: the explicit endpoint if given, else the
/// stored one, else 127.0.0.1:9876; whatever is chosen is saved back.
[[nodiscard]] ConfigResult<TransportDescriptor> resolve_bridge_transport(
    BridgeMode mode,
    const BridgeOptions& options,
    const BridgeEndpointStore& store
);

}  // namespace devflow
