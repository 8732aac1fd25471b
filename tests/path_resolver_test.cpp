// ─────────────────────────────────────────────────────────────────────────────
// Path Resolver Tests
// ─────────────────────────────────────────────────────────────────────────────
// Every test injects its own environment and existence probe, so Windows and
// macOS layouts are checked on any host.

#include <catch2/catch_test_macros.hpp>

#include "devflow/platform/path_resolver.hpp"

#include <filesystem>
#include <map>
#include <set>
#include <string>

using namespace devflow;

namespace {

using Vars = std::map<std::string, std::string, std::less<>>;

EnvironmentLookup fake_env(Vars vars) {
    return [vars = std::move(vars)](std::string_view name) -> std::optional<std::string> {
        const auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

FileProbe fake_files(std::set<std::string> existing) {
    return [existing = std::move(existing)](const std::filesystem::path& path) {
        return existing.contains(path.generic_string());
    };
}

FileProbe nothing_exists() {
    return [](const std::filesystem::path&) { return false; };
}

PathResolver linux_paths(Vars vars = {{"HOME", "/home/dev"}}) {
    return PathResolver(PlatformProvider(Platform::Linux), fake_env(std::move(vars)), nothing_exists());
}

PathResolver windows_paths(Vars vars) {
    return PathResolver(PlatformProvider(Platform::Windows), fake_env(std::move(vars)), nothing_exists());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Docker socket
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Docker socket by platform", "[paths][docker]") {
    SECTION("Linux and WSL2 use the unix socket") {
        REQUIRE(linux_paths().docker_socket() == "/var/run/docker.sock");

        PathResolver wsl(PlatformProvider(Platform::WSL2), fake_env({{"HOME", "/home/dev"}}), nothing_exists());
        REQUIRE(wsl.docker_socket() == "/var/run/docker.sock");
    }

    SECTION("Windows uses the named pipe") {
        auto paths = windows_paths({{"USERPROFILE", "C:/Users/dev"}});
        REQUIRE(paths.docker_socket() == "//./pipe/docker_engine");
    }

    SECTION("macOS prefers the Docker Desktop socket when it exists") {
        PathResolver with_desktop(
            PlatformProvider(Platform::MacOS),
            fake_env({{"HOME", "/Users/dev"}}),
            fake_files({"/Users/dev/.docker/run/docker.sock"}));
        REQUIRE(with_desktop.docker_socket() == "/Users/dev/.docker/run/docker.sock");

        PathResolver without_desktop(
            PlatformProvider(Platform::MacOS), fake_env({{"HOME", "/Users/dev"}}), nothing_exists());
        REQUIRE(without_desktop.docker_socket() == "/var/run/docker.sock");
    }
}

TEST_CASE("Socket mount string", "[paths][docker]") {
    REQUIRE(linux_paths().socket_mount() == "/var/run/docker.sock:/var/run/docker.sock");
    REQUIRE(linux_paths().socket_mount("/docker.sock") == "/var/run/docker.sock:/docker.sock");

    auto windows = windows_paths({{"USERPROFILE", "C:/Users/dev"}});
    REQUIRE(windows.socket_mount() == "//./pipe/docker_engine:/var/run/docker.sock");
}

// ═══════════════════════════════════════════════════════════════════════════
// Directories
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Linux directory layout", "[paths][linux]") {
    auto paths = linux_paths();

    REQUIRE(paths.hosts_file() == "/etc/hosts");
    REQUIRE(paths.devflow_home().generic_string() == "/home/dev/.devflow");
    REQUIRE(paths.ssh_dir().generic_string() == "/home/dev/.ssh");
    REQUIRE(paths.cert_dir().generic_string() == "/home/dev/.local/share/mkcert");
    REQUIRE(paths.docker_config_dir().generic_string() == "/home/dev/.docker");
}

TEST_CASE("macOS certificates live under Application Support", "[paths][macos]") {
    PathResolver paths(PlatformProvider(Platform::MacOS), fake_env({{"HOME", "/Users/dev"}}), nothing_exists());
    REQUIRE(paths.cert_dir().generic_string() == "/Users/dev/Library/Application Support/mkcert");
    REQUIRE(paths.devflow_home().generic_string() == "/Users/dev/.devflow");
}

TEST_CASE("Windows directory layout", "[paths][windows]") {
    auto paths = windows_paths({
        {"USERPROFILE", "C:/Users/dev"},
        {"APPDATA", "C:/Users/dev/AppData/Roaming"},
        {"LOCALAPPDATA", "C:/Users/dev/AppData/Local"}
    });

    REQUIRE(paths.hosts_file().generic_string() == "C:/Windows/System32/drivers/etc/hosts");
    REQUIRE(paths.devflow_home().generic_string() == "C:/Users/dev/AppData/Roaming/devflow");
    REQUIRE(paths.ssh_dir().generic_string() == "C:/Users/dev/.ssh");
    REQUIRE(paths.cert_dir().generic_string() == "C:/Users/dev/AppData/Local/mkcert");
    REQUIRE(paths.docker_config_dir().generic_string() == "C:/Users/dev/.docker");

    SECTION("Falls back to the profile when APPDATA is unset") {
        auto bare = windows_paths({{"USERPROFILE", "C:/Users/dev"}});
        REQUIRE(bare.devflow_home().generic_string() == "C:/Users/dev/.devflow");
        REQUIRE(bare.cert_dir().generic_string() == "C:/Users/dev/.local/share/mkcert");
    }
}

TEST_CASE("resolve() agrees with the typed accessors", "[paths]") {
    auto paths = linux_paths();

    REQUIRE(paths.resolve(ResourceKind::DockerSocket) == paths.docker_socket());
    REQUIRE(paths.resolve(ResourceKind::HostsFile) == "/etc/hosts");
    REQUIRE(paths.resolve(ResourceKind::DevflowHome) == "/home/dev/.devflow");
    REQUIRE(paths.resolve(ResourceKind::SshDir) == "/home/dev/.ssh");
    REQUIRE(paths.resolve(ResourceKind::CertDir) == "/home/dev/.local/share/mkcert");
    REQUIRE(paths.resolve(ResourceKind::DockerConfigDir) == "/home/dev/.docker");
    REQUIRE(paths.resolve(ResourceKind::SocketMount, "/sock") == "/var/run/docker.sock:/sock");
}

TEST_CASE("Missing home directory is an error on Windows", "[paths][error]") {
    auto paths = windows_paths({});
    REQUIRE_THROWS_AS(paths.home_dir(), PathResolutionError);
    REQUIRE_THROWS_AS(paths.devflow_home(), PathResolutionError);
}

TEST_CASE("Empty variables count as unset", "[paths]") {
    auto paths = windows_paths({{"USERPROFILE", "C:/Users/dev"}, {"APPDATA", ""}});
    REQUIRE(paths.devflow_home().generic_string() == "C:/Users/dev/.devflow");
}

TEST_CASE("Environment is read on every call", "[paths]") {
    std::string home = "/home/first";
    PathResolver paths(
        PlatformProvider(Platform::Linux),
        [&home](std::string_view name) -> std::optional<std::string> {
            if (name == "HOME") {
                return home;
            }
            return std::nullopt;
        },
        nothing_exists());

    REQUIRE(paths.ssh_dir().generic_string() == "/home/first/.ssh");
    home = "/home/second";
    REQUIRE(paths.ssh_dir().generic_string() == "/home/second/.ssh");
}

// ═══════════════════════════════════════════════════════════════════════════
// Expansion
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("expand_path handles tilde", "[paths][expand]") {
    auto paths = linux_paths();

    REQUIRE(paths.expand_path("~").generic_string() == "/home/dev");
    REQUIRE(paths.expand_path("~/projects/app").generic_string() == "/home/dev/projects/app");

    // Only a leading "~" or "~/" refers to the home directory
    REQUIRE(paths.expand_path("/tmp/~cache").generic_string() == "/tmp/~cache");
}

TEST_CASE("expand_path substitutes variables", "[paths][expand]") {
    auto paths = linux_paths({{"HOME", "/home/dev"}, {"WORKSPACE", "/srv/work"}, {"PROJECT", "api"}});

    REQUIRE(paths.expand_path("$WORKSPACE/$PROJECT").generic_string() == "/srv/work/api");
    REQUIRE(paths.expand_path("${WORKSPACE}/${PROJECT}-v2").generic_string() == "/srv/work/api-v2");

    SECTION("Unknown variables are left in place") {
        REQUIRE(paths.expand_variables("$NOPE/x") == "$NOPE/x");
        REQUIRE(paths.expand_variables("${NOPE}/x") == "${NOPE}/x");
    }

    SECTION("A lone dollar sign is literal") {
        REQUIRE(paths.expand_variables("/price$") == "/price$");
    }

    SECTION("Percent syntax is Windows only") {
        REQUIRE(paths.expand_variables("%PROJECT%") == "%PROJECT%");

        auto windows = windows_paths({{"USERPROFILE", "C:/Users/dev"}, {"PROJECT", "api"}});
        REQUIRE(windows.expand_variables("%PROJECT%/src") == "api/src");
    }
}

TEST_CASE("expand_path normalizes and makes absolute", "[paths][expand]") {
    auto paths = linux_paths();

    REQUIRE(paths.expand_path("/srv/work/../data/./db").generic_string() == "/srv/data/db");

    const auto relative = paths.expand_path("config/app.json");
    REQUIRE(relative.is_absolute());
    REQUIRE(relative == (std::filesystem::current_path() / "config/app.json").lexically_normal());
}

// ═══════════════════════════════════════════════════════════════════════════
// Tool binaries
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Tool binary names", "[paths][tools]") {
    auto linux_host = linux_paths();
    REQUIRE(linux_host.tool_binary(Tool::Docker) == "docker");
    REQUIRE(linux_host.tool_binary(Tool::OnePassword) == "op");
    REQUIRE(linux_host.tool_binary(Tool::GitHub) == "gh");

    auto windows = windows_paths({{"USERPROFILE", "C:/Users/dev"}});
    REQUIRE(windows.tool_binary(Tool::Mkcert) == "mkcert.exe");
    REQUIRE(windows.tool_binary(Tool::Supabase) == "supabase.exe");
    REQUIRE(windows.tool_binary("ssh.exe") == "ssh.exe");
}

TEST_CASE("find_tool searches PATH in order", "[paths][tools]") {
    PathResolver paths(
        PlatformProvider(Platform::Linux),
        fake_env({{"HOME", "/home/dev"}, {"PATH", "/usr/local/bin::/usr/bin:/opt/bin"}}),
        fake_files({"/usr/bin/docker", "/opt/bin/docker", "/opt/bin/mkcert"}));

    REQUIRE(paths.find_tool(Tool::Docker) == std::filesystem::path("/usr/bin/docker"));
    REQUIRE(paths.find_tool(Tool::Mkcert) == std::filesystem::path("/opt/bin/mkcert"));
    REQUIRE_FALSE(paths.find_tool(Tool::Supabase).has_value());
}

TEST_CASE("find_tool uses the Windows separator and suffix", "[paths][tools][windows]") {
    PathResolver paths(
        PlatformProvider(Platform::Windows),
        fake_env({{"USERPROFILE", "C:/Users/dev"}, {"PATH", "C:/Tools;C:/Program Files/GitHub CLI"}}),
        fake_files({"C:/Program Files/GitHub CLI/gh.exe"}));

    const auto gh = paths.find_tool(Tool::GitHub);
    REQUIRE(gh.has_value());
    REQUIRE(gh->generic_string() == "C:/Program Files/GitHub CLI/gh.exe");
}

TEST_CASE("find_tool without PATH finds nothing", "[paths][tools]") {
    REQUIRE_FALSE(linux_paths().find_tool(Tool::Docker).has_value());
}
