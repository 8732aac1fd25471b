#include "devflow/service/service_config.hpp"
#include "devflow/config/json_file.hpp"

#include <charconv>
#include <limits>

namespace devflow {

namespace {

constexpr std::string_view kServiceFileName = "service.json";

[[nodiscard]] std::optional<std::uint16_t> parse_port(std::string_view text) {
    unsigned value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    // 0 asks for any free port, as in service.json and --port.
    if (ec != std::errc{} || ptr != end || value > std::numeric_limits<std::uint16_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

// Typed field readers for service.json. Absent keys leave `out` untouched.

ConfigResult<void> read_string(const Json& doc, const char* key, const std::filesystem::path& source,
                               std::optional<std::string>& out) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return {};
    }
    if (it->is_string() == false) {
        return tl::unexpected(ConfigError::malformed(source, std::string("'") + key + "' must be a string"));
    }
    out = it->get<std::string>();
    return {};
}

ConfigResult<void> read_unsigned(const Json& doc, const char* key, const std::filesystem::path& source,
                                 std::uint64_t max, std::optional<std::uint64_t>& out) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return {};
    }
    if (it->is_number_integer() == false || it->get<std::int64_t>() < 0 ||
        it->get<std::uint64_t>() > max) {
        return tl::unexpected(ConfigError::malformed(
            source, std::string("'") + key + "' must be an integer between 0 and " + std::to_string(max)));
    }
    out = it->get<std::uint64_t>();
    return {};
}

}  // namespace

std::optional<DispatchMode> parse_dispatch_mode(std::string_view text) {
    if (text == "concurrent") {
        return DispatchMode::Concurrent;
    }
    if (text == "sequential") {
        return DispatchMode::Sequential;
    }
    return std::nullopt;
}

RpcServerConfig ServiceConfig::server_config() const {
    RpcServerConfig config;
    if (stdio) {
        config.with_stdio();
    } else {
        config.with_tcp(host, port);
    }
    config.with_dispatch(dispatch).with_handler_threads(handler_threads);
    config.transport.max_frame_size = max_frame_size;
    return config;
}

// ═══════════════════════════════════════════════════════════════════════════
// Layers
// ═══════════════════════════════════════════════════════════════════════════

ConfigResult<void> apply_json(ServiceConfig& config, const Json& document, const std::filesystem::path& source) {
    if (document.is_object() == false) {
        return tl::unexpected(ConfigError::malformed(source, "expected an object"));
    }

    // Read everything into a copy first so a bad key leaves `config` as it was.
    ServiceConfig next = config;

    std::optional<std::string> text;
    if (auto r = read_string(document, "host", source, text); !r) {
        return r;
    }
    if (text) {
        next.host = *text;
    }

    std::optional<std::uint64_t> number;
    if (auto r = read_unsigned(document, "port", source, std::numeric_limits<std::uint16_t>::max(), number); !r) {
        return r;
    }
    if (number) {
        next.port = static_cast<std::uint16_t>(*number);
    }

    if (auto it = document.find("stdio"); it != document.end() && it->is_null() == false) {
        if (it->is_boolean() == false) {
            return tl::unexpected(ConfigError::malformed(source, "'stdio' must be a boolean"));
        }
        next.stdio = it->get<bool>();
    }

    number.reset();
    if (auto r = read_unsigned(document, "grace_period_ms", source, 3'600'000, number); !r) {
        return r;
    }
    if (number) {
        next.grace_period = std::chrono::milliseconds(*number);
    }

    number.reset();
    if (auto r = read_unsigned(document, "handler_threads", source, 256, number); !r) {
        return r;
    }
    if (number) {
        next.handler_threads = static_cast<std::size_t>(*number);
    }

    number.reset();
    if (auto r = read_unsigned(document, "max_frame_size", source, std::uint64_t{1} << 30, number); !r) {
        return r;
    }
    if (number) {
        next.max_frame_size = static_cast<std::size_t>(*number);
    }

    text.reset();
    if (auto r = read_string(document, "dispatch", source, text); !r) {
        return r;
    }
    if (text) {
        auto mode = parse_dispatch_mode(*text);
        if (!mode) {
            return tl::unexpected(ConfigError::malformed(source, "unknown dispatch mode '" + *text + "'"));
        }
        next.dispatch = *mode;
    }

    text.reset();
    if (auto r = read_string(document, "log_level", source, text); !r) {
        return r;
    }
    if (text) {
        auto level = parse_log_level(*text);
        if (!level) {
            return tl::unexpected(ConfigError::malformed(source, "unknown log level '" + *text + "'"));
        }
        next.log_level = *level;
    }

    text.reset();
    if (auto r = read_string(document, "log_file", source, text); !r) {
        return r;
    }
    if (text) {
        next.log_file = std::filesystem::path(*text);
    }

    config = std::move(next);
    return {};
}

ConfigResult<void> apply_environment(ServiceConfig& config, const EnvironmentLookup& env) {
    auto lookup = [&env](std::string_view name) -> std::optional<std::string> {
        auto value = env(name);
        if (value && value->empty()) {
            return std::nullopt;
        }
        return value;
    };

    ServiceConfig next = config;

    if (auto host = lookup("DEVFLOW_SERVICE_HOST")) {
        next.host = *host;
    }
    if (auto port = lookup("DEVFLOW_SERVICE_PORT")) {
        auto parsed = parse_port(*port);
        if (!parsed) {
            return tl::unexpected(ConfigError::invalid_value("DEVFLOW_SERVICE_PORT is not a valid port: " + *port));
        }
        next.port = *parsed;
    }
    if (auto level = lookup("DEVFLOW_LOG_LEVEL")) {
        auto parsed = parse_log_level(*level);
        if (!parsed) {
            return tl::unexpected(ConfigError::invalid_value("DEVFLOW_LOG_LEVEL is not a log level: " + *level));
        }
        next.log_level = *parsed;
    }

    config = std::move(next);
    return {};
}

void apply_overrides(ServiceConfig& config, const ServiceOverrides& overrides) {
    if (overrides.host) {
        config.host = *overrides.host;
    }
    if (overrides.port) {
        config.port = *overrides.port;
    }
    if (overrides.stdio) {
        config.stdio = *overrides.stdio;
    }
    if (overrides.grace_period) {
        config.grace_period = *overrides.grace_period;
    }
    if (overrides.log_level) {
        config.log_level = *overrides.log_level;
    }
    if (overrides.log_file) {
        config.log_file = *overrides.log_file;
    }
}

ConfigResult<ServiceConfig> load_service_config(
    const PathResolver& paths,
    const std::optional<std::filesystem::path>& explicit_file,
    const EnvironmentLookup& env
) {
    ServiceConfig config;

    std::filesystem::path file;
    if (explicit_file) {
        file = *explicit_file;
    } else {
        try {
            file = paths.devflow_home() / kServiceFileName;
        } catch (const PathResolutionError& e) {
            // Defaults and environment still apply.
            DEVFLOW_LOG_DEBUG("Skipping service.json: {}", e.what());
        }
    }

    if (!file.empty()) {
        auto document = read_json_file(file);
        if (!document) {
            return tl::unexpected(document.error());
        }
        if (document->has_value()) {
            if (auto applied = apply_json(config, **document, file); !applied) {
                return tl::unexpected(applied.error());
            }
        } else if (explicit_file) {
            return tl::unexpected(ConfigError::unreadable(file, "file does not exist"));
        }
    }

    if (auto applied = apply_environment(config, env); !applied) {
        return tl::unexpected(applied.error());
    }
    return config;
}

}  // namespace devflow
