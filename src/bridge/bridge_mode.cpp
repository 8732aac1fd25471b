#include "devflow/bridge/bridge_mode.hpp"
#include "devflow/config/json_file.hpp"
#include "devflow/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace devflow {

namespace {

[[nodiscard]] std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

std::optional<BridgeMode> parse_bridge_mode(std::string_view text) {
    const std::string mode = lowercase(text);
    if (mode == "subprocess") {
        return BridgeMode::Subprocess;
    }
    if (mode == "tcp") {
        return BridgeMode::Tcp;
    }
    return std::nullopt;
}

BridgeMode select_bridge_mode(const PlatformProvider& platform, std::optional<BridgeMode> override_mode) noexcept {
    if (override_mode.has_value()) {
        return *override_mode;
    }
    // A Windows UI cannot spawn the POSIX service directly.
    return platform.is_windows() ? BridgeMode::Tcp : BridgeMode::Subprocess;
}

// ═══════════════════════════════════════════════════════════════════════════
// BridgeEndpointStore
// ═══════════════════════════════════════════════════════════════════════════

BridgeEndpointStore BridgeEndpointStore::at_default_location(const PathResolver& paths) {
    return BridgeEndpointStore(paths.devflow_home() / kFileName);
}

ConfigResult<std::optional<TcpEndpoint>> BridgeEndpointStore::load() const {
    auto document = read_json_file(file_);
    if (!document) {
        return tl::unexpected(document.error());
    }
    if (!document->has_value()) {
        return std::optional<TcpEndpoint>{};
    }

    const Json& root = **document;
    if (root.is_object() == false) {
        return tl::unexpected(ConfigError::malformed(file_, "expected an object"));
    }

    TcpEndpoint endpoint;
    if (auto it = root.find("host"); it != root.end()) {
        if (it->is_string() == false || it->get_ref<const std::string&>().empty()) {
            return tl::unexpected(ConfigError::malformed(file_, "'host' must be a non-empty string"));
        }
        endpoint.host = it->get<std::string>();
    }
    if (auto it = root.find("port"); it != root.end()) {
        if (it->is_number_integer() == false) {
            return tl::unexpected(ConfigError::malformed(file_, "'port' must be an integer"));
        }
        const auto port = it->get<std::int64_t>();
        if (port <= 0 || port > std::numeric_limits<std::uint16_t>::max()) {
            return tl::unexpected(ConfigError::malformed(file_, "'port' out of range: " + std::to_string(port)));
        }
        endpoint.port = static_cast<std::uint16_t>(port);
    }
    return std::optional<TcpEndpoint>(std::move(endpoint));
}

ConfigResult<void> BridgeEndpointStore::save(const TcpEndpoint& endpoint) const {
    Json document = {
        {"mode", std::string(to_string(BridgeMode::Tcp))},
        {"host", endpoint.host},
        {"port", endpoint.port}
    };
    return write_json_file(file_, document);
}

// ═══════════════════════════════════════════════════════════════════════════
// Transport resolution
// ═══════════════════════════════════════════════════════════════════════════

ConfigResult<TransportDescriptor> resolve_bridge_transport(
    BridgeMode mode,
    const BridgeOptions& options,
    const BridgeEndpointStore& store
) {
    if (mode == BridgeMode::Subprocess) {
        return TransportDescriptor{options.service_command};
    }

    TcpEndpoint endpoint;
    if (options.tcp_endpoint.has_value()) {
        endpoint = *options.tcp_endpoint;
    } else {
        auto stored = store.load();
        if (!stored) {
            return tl::unexpected(stored.error());
        }
        if (stored->has_value()) {
            endpoint = **stored;
        }
    }

    if (auto saved = store.save(endpoint); !saved) {
        // Connecting still works; only the next start loses the endpoint.
        DEVFLOW_LOG_WARN("Cannot remember bridge endpoint: {}", saved.error().message);
    }
    return TransportDescriptor{std::move(endpoint)};
}

}  // namespace devflow
