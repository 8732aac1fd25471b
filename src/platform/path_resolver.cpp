#include "devflow/platform/path_resolver.hpp"

#include <cctype>
#include <cstdlib>
#include <system_error>
#include <vector>

#if defined(__unix__) || defined(__APPLE__)
#include <pwd.h>
#include <unistd.h>
#endif

namespace devflow {

namespace {

[[nodiscard]] bool is_name_char(char c) noexcept {
    return (std::isalnum(static_cast<unsigned char>(c)) != 0) || (c == '_');
}

[[nodiscard]] bool has_drive_prefix(const std::string& text) noexcept {
    const bool drive_letter = (text.size() >= 3)
        && (std::isalpha(static_cast<unsigned char>(text[0])) != 0)
        && (text[1] == ':')
        && (text[2] == '/' || text[2] == '\\');
    const bool unc = text.starts_with("//") || text.starts_with("\\\\");
    return drive_letter || unc;
}

#if defined(__unix__) || defined(__APPLE__)
std::optional<std::string> home_from_passwd() {
    std::vector<char> buffer(16384);
    struct passwd pwd {};
    struct passwd* result = nullptr;
    const int rc = ::getpwuid_r(::getuid(), &pwd, buffer.data(), buffer.size(), &result);
    if (rc != 0 || result == nullptr || result->pw_dir == nullptr) {
        return std::nullopt;
    }
    return std::string(result->pw_dir);
}
#endif

}  // namespace

EnvironmentLookup process_environment() {
    return [](std::string_view name) -> std::optional<std::string> {
        const std::string key(name);
        const char* value = std::getenv(key.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

FileProbe filesystem_probe() {
    return [](const std::filesystem::path& path) {
        std::error_code ec;
        return std::filesystem::exists(path, ec);
    };
}

PathResolver::PathResolver(PlatformProvider platform, EnvironmentLookup env, FileProbe probe)
    : platform_(platform)
    , env_(std::move(env))
    , probe_(std::move(probe))
{
    if (!env_) {
        env_ = process_environment();
    }
    if (!probe_) {
        probe_ = filesystem_probe();
    }
}

std::optional<std::string> PathResolver::env(std::string_view name) const {
    auto value = env_(name);
    if (value.has_value() && value->empty()) {
        return std::nullopt;
    }
    return value;
}

std::filesystem::path PathResolver::env_path_or(std::string_view name,
                                                const std::filesystem::path& fallback) const {
    const auto value = env(name);
    return value.has_value() ? std::filesystem::path(*value) : fallback;
}

// ─────────────────────────────────────────────────────────────────────────────
// Home and expansion
// ─────────────────────────────────────────────────────────────────────────────

std::filesystem::path PathResolver::home_dir() const {
    if (platform_.is_windows()) {
        if (auto profile = env("USERPROFILE")) {
            return *profile;
        }
    }
    if (auto home = env("HOME")) {
        return *home;
    }
#if defined(__unix__) || defined(__APPLE__)
    if (platform_.is_unix_like()) {
        if (auto home = home_from_passwd()) {
            return *home;
        }
    }
#endif
    throw PathResolutionError("cannot determine home directory");
}

std::string PathResolver::expand_variables(std::string_view raw) const {
    std::string out;
    out.reserve(raw.size());

    std::size_t i = 0;
    while (i < raw.size()) {
        const char c = raw[i];

        if (c == '$' && i + 1 < raw.size() && raw[i + 1] == '{') {
            const auto close = raw.find('}', i + 2);
            if (close != std::string_view::npos) {
                const auto name = raw.substr(i + 2, close - i - 2);
                std::optional<std::string> value;
                if (name.empty() == false) {
                    value = env_(name);
                }
                if (value.has_value()) {
                    out += *value;
                } else {
                    out.append(raw.substr(i, close - i + 1));
                }
                i = close + 1;
                continue;
            }
        } else if (c == '$') {
            std::size_t end = i + 1;
            while (end < raw.size() && is_name_char(raw[end])) {
                ++end;
            }
            if (end > i + 1) {
                const auto name = raw.substr(i + 1, end - i - 1);
                const auto value = env_(name);
                if (value.has_value()) {
                    out += *value;
                } else {
                    out.append(raw.substr(i, end - i));
                }
                i = end;
                continue;
            }
        } else if (c == '%' && platform_.is_windows()) {
            const auto close = raw.find('%', i + 1);
            if (close != std::string_view::npos && close > i + 1) {
                const auto name = raw.substr(i + 1, close - i - 1);
                const auto value = env_(name);
                if (value.has_value()) {
                    out += *value;
                    i = close + 1;
                    continue;
                }
            }
        }

        out.push_back(c);
        ++i;
    }
    return out;
}

std::filesystem::path PathResolver::make_absolute(const std::filesystem::path& path) const {
    if (path.is_absolute()) {
        return path.lexically_normal();
    }
    if (platform_.is_windows() && has_drive_prefix(path.generic_string())) {
        return path.lexically_normal();
    }
    return (std::filesystem::current_path() / path).lexically_normal();
}

std::filesystem::path PathResolver::expand_path(std::string_view raw) const {
    std::string text(raw);

    const bool bare_tilde = (text == "~");
    const bool tilde_prefix = text.starts_with("~/") || text.starts_with("~\\");
    if (bare_tilde || tilde_prefix) {
        std::string home = home_dir().string();
        text = bare_tilde ? home : home + "/" + text.substr(2);
    }

    return make_absolute(std::filesystem::path(expand_variables(text)));
}

// ─────────────────────────────────────────────────────────────────────────────
// Resource locations
// ─────────────────────────────────────────────────────────────────────────────

std::string PathResolver::docker_socket() const {
    switch (platform_.platform()) {
        case Platform::Windows:
            return std::string(kWindowsDockerPipe);
        case Platform::MacOS: {
            const auto desktop_socket = home_dir() / ".docker" / "run" / "docker.sock";
            if (probe_(desktop_socket)) {
                return desktop_socket.generic_string();
            }
            return std::string(kUnixDockerSocket);
        }
        case Platform::Linux:
        case Platform::WSL2:
            break;
    }
    return std::string(kUnixDockerSocket);
}

std::filesystem::path PathResolver::hosts_file() const {
    if (platform_.is_windows()) {
        return "C:/Windows/System32/drivers/etc/hosts";
    }
    return "/etc/hosts";
}

std::filesystem::path PathResolver::devflow_home() const {
    if (platform_.is_windows()) {
        if (auto appdata = env("APPDATA")) {
            return std::filesystem::path(*appdata) / "devflow";
        }
        return env_path_or("USERPROFILE", home_dir()) / ".devflow";
    }
    return home_dir() / ".devflow";
}

std::filesystem::path PathResolver::ssh_dir() const {
    if (platform_.is_windows()) {
        return env_path_or("USERPROFILE", home_dir()) / ".ssh";
    }
    return home_dir() / ".ssh";
}

std::filesystem::path PathResolver::cert_dir() const {
    switch (platform_.platform()) {
        case Platform::Windows:
            if (auto local = env("LOCALAPPDATA")) {
                return std::filesystem::path(*local) / "mkcert";
            }
            return env_path_or("USERPROFILE", home_dir()) / ".local" / "share" / "mkcert";
        case Platform::MacOS:
            return home_dir() / "Library" / "Application Support" / "mkcert";
        case Platform::Linux:
        case Platform::WSL2:
            break;
    }
    return home_dir() / ".local" / "share" / "mkcert";
}

std::filesystem::path PathResolver::docker_config_dir() const {
    if (platform_.is_windows()) {
        return env_path_or("USERPROFILE", home_dir()) / ".docker";
    }
    return home_dir() / ".docker";
}

std::string PathResolver::socket_mount(std::string_view target) const {
    return docker_socket() + ":" + std::string(target);
}

std::string PathResolver::resolve(ResourceKind kind, std::string_view mount_target) const {
    switch (kind) {
        case ResourceKind::DockerSocket:    return docker_socket();
        case ResourceKind::HostsFile:       return hosts_file().generic_string();
        case ResourceKind::DevflowHome:     return devflow_home().generic_string();
        case ResourceKind::SshDir:          return ssh_dir().generic_string();
        case ResourceKind::CertDir:         return cert_dir().generic_string();
        case ResourceKind::DockerConfigDir: return docker_config_dir().generic_string();
        case ResourceKind::SocketMount:     return socket_mount(mount_target);
    }
    throw std::invalid_argument("unknown ResourceKind");
}

// ─────────────────────────────────────────────────────────────────────────────
// Tool binaries
// ─────────────────────────────────────────────────────────────────────────────

std::string PathResolver::tool_binary(Tool tool) const {
    return tool_binary(tool_base_name(tool));
}

std::string PathResolver::tool_binary(std::string_view base_name) const {
    std::string name(base_name);
    if (platform_.is_windows() && name.ends_with(".exe") == false) {
        name += ".exe";
    }
    return name;
}

std::optional<std::filesystem::path> PathResolver::find_tool(Tool tool) const {
    const auto search_path = env("PATH");
    if (search_path.has_value() == false) {
        return std::nullopt;
    }

    const char separator = platform_.is_windows() ? ';' : ':';
    const std::string executable = tool_binary(tool);

    std::string_view remaining(*search_path);
    while (remaining.empty() == false) {
        const auto split = remaining.find(separator);
        const auto entry = remaining.substr(0, split);
        if (entry.empty() == false) {
            auto candidate = std::filesystem::path(entry) / executable;
            if (probe_(candidate)) {
                return candidate;
            }
        }
        if (split == std::string_view::npos) {
            break;
        }
        remaining.remove_prefix(split + 1);
    }
    return std::nullopt;
}

}  // namespace devflow
