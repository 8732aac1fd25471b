#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Path Resolver
// ═══════════════════════════════════════════════════════════════════════════
// Maps abstract resource kinds and tool names to the concrete locations used
// on the current platform. Nothing is cached and nothing is created: each
// call reads the environment as it is at that moment.
//
//   PathResolver paths(PlatformProvider::detected());
//   auto mount = paths.socket_mount();            // "/var/run/docker.sock:/var/run/docker.sock"
//   auto certs = paths.cert_dir();                // ~/.local/share/mkcert on Linux
//   auto op    = paths.tool_binary(Tool::OnePassword);  // "op.exe" on Windows

#include "devflow/platform/platform.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace devflow {

enum class ResourceKind : std::uint8_t {
    DockerSocket,
    HostsFile,
    DevflowHome,
    SshDir,
    CertDir,
    DockerConfigDir,
    SocketMount
};

[[nodiscard]] constexpr std::string_view to_string(ResourceKind kind) noexcept {
    switch (kind) {
        case ResourceKind::DockerSocket:    return "docker_socket";
        case ResourceKind::HostsFile:       return "hosts_file";
        case ResourceKind::DevflowHome:     return "devflow_home";
        case ResourceKind::SshDir:          return "ssh_dir";
        case ResourceKind::CertDir:         return "cert_dir";
        case ResourceKind::DockerConfigDir: return "docker_config_dir";
        case ResourceKind::SocketMount:     return "socket_mount";
    }
    return "unknown";
}

/// External command-line tools wrapped by providers.
enum class Tool : std::uint8_t {
    Docker,
    Ssh,
    OnePassword,
    GitHub,
    Supabase,
    Mkcert
};

/// Executable base name without any platform suffix.
[[nodiscard]] constexpr std::string_view tool_base_name(Tool tool) noexcept {
    switch (tool) {
        case Tool::Docker:      return "docker";
        case Tool::Ssh:         return "ssh";
        case Tool::OnePassword: return "op";
        case Tool::GitHub:      return "gh";
        case Tool::Supabase:    return "supabase";
        case Tool::Mkcert:      return "mkcert";
    }
    return "";
}

inline constexpr std::string_view kDockerSocketMountTarget = "/var/run/docker.sock";
inline constexpr std::string_view kUnixDockerSocket = "/var/run/docker.sock";
inline constexpr std::string_view kWindowsDockerPipe = "//./pipe/docker_engine";

/// Raised when no home directory can be determined.
class PathResolutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Environment variable lookup; returns nullopt for unset variables.
using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view)>;

/// Existence probe used for platform-dependent fallbacks (macOS socket, PATH search).
using FileProbe = std::function<bool(const std::filesystem::path&)>;

[[nodiscard]] EnvironmentLookup process_environment();
[[nodiscard]] FileProbe filesystem_probe();

class PathResolver {
public:
    explicit PathResolver(
        PlatformProvider platform,
        EnvironmentLookup env = process_environment(),
        FileProbe probe = filesystem_probe()
    );

    [[nodiscard]] const PlatformProvider& platform() const noexcept { return platform_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Resource locations
    // ─────────────────────────────────────────────────────────────────────────

    /// Docker daemon endpoint: unix socket path or Windows named pipe.
    [[nodiscard]] std::string docker_socket() const;
    [[nodiscard]] std::filesystem::path hosts_file() const;
    [[nodiscard]] std::filesystem::path devflow_home() const;
    [[nodiscard]] std::filesystem::path ssh_dir() const;
    [[nodiscard]] std::filesystem::path cert_dir() const;
    [[nodiscard]] std::filesystem::path docker_config_dir() const;

    /// Bind-mount string "<host socket>:<target>" for containers that talk to Docker.
    [[nodiscard]] std::string socket_mount(std::string_view target = kDockerSocketMountTarget) const;

    /// Generic form of the accessors above. `mount_target` only applies to SocketMount.
    [[nodiscard]] std::string resolve(
        ResourceKind kind,
        std::string_view mount_target = kDockerSocketMountTarget
    ) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Home and expansion
    // ─────────────────────────────────────────────────────────────────────────

    /// USERPROFILE on Windows, HOME elsewhere, then the password database.
    /// Throws PathResolutionError if none is available.
    [[nodiscard]] std::filesystem::path home_dir() const;

    /// Expand a leading "~", then $VAR / ${VAR} (and %VAR% on Windows), then
    /// make the result absolute and lexically normal. Unknown variables are
    /// left in place. Symlinks are not resolved.
    [[nodiscard]] std::filesystem::path expand_path(std::string_view raw) const;

    /// Only the variable-substitution step of expand_path().
    [[nodiscard]] std::string expand_variables(std::string_view raw) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Tool binaries
    // ─────────────────────────────────────────────────────────────────────────

    /// Executable name for this platform ("mkcert" or "mkcert.exe").
    [[nodiscard]] std::string tool_binary(Tool tool) const;
    [[nodiscard]] std::string tool_binary(std::string_view base_name) const;

    /// Search PATH for the tool's executable.
    [[nodiscard]] std::optional<std::filesystem::path> find_tool(Tool tool) const;

private:
    [[nodiscard]] std::optional<std::string> env(std::string_view name) const;
    [[nodiscard]] std::filesystem::path env_path_or(std::string_view name,
                                                    const std::filesystem::path& fallback) const;
    [[nodiscard]] std::filesystem::path make_absolute(const std::filesystem::path& path) const;

    PlatformProvider platform_;
    EnvironmentLookup env_;
    FileProbe probe_;
};

}  // namespace devflow
