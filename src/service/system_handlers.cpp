#include "devflow/service/system_handlers.hpp"
#include "devflow/version.hpp"

#include <array>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

namespace devflow {

namespace {

constexpr std::array kAllResources = {
    ResourceKind::DockerSocket,
    ResourceKind::HostsFile,
    ResourceKind::DevflowHome,
    ResourceKind::SshDir,
    ResourceKind::CertDir,
    ResourceKind::DockerConfigDir,
    ResourceKind::SocketMount
};

constexpr std::array kAllTools = {
    Tool::Docker,
    Tool::Ssh,
    Tool::OnePassword,
    Tool::GitHub,
    Tool::Supabase,
    Tool::Mkcert
};

[[nodiscard]] std::int64_t process_id() noexcept {
#ifdef _WIN32
    return static_cast<std::int64_t>(::_getpid());
#else
    return static_cast<std::int64_t>(::getpid());
#endif
}

[[nodiscard]] std::string compiler_id() {
#if defined(__clang__)
    return "clang " __clang_version__;
#elif defined(__GNUC__)
    return "gcc " __VERSION__;
#elif defined(_MSC_VER)
    return "msvc " + std::to_string(_MSC_VER);
#else
    return "unknown";
#endif
}

}  // namespace

std::vector<HandlerRegistry::Entry> system_handlers(const PathResolver& paths) {
    std::vector<HandlerRegistry::Entry> entries;

    entries.emplace_back("ping", [](const Json&) -> HandlerResult {
        return Json{{"pong", true}, {"version", std::string(kVersion)}};
    });

    entries.emplace_back("version", [paths](const Json&) -> HandlerResult {
        return Json{
            {"devflow", std::string(kVersion)},
            {"compiler", compiler_id()},
            {"platform", std::string(paths.platform().name())}
        };
    });

    entries.emplace_back("info", [paths](const Json&) -> HandlerResult {
        Json info = {
            {"platform", std::string(paths.platform().name())},
            {"version", std::string(kVersion)},
            {"pid", process_id()}
        };
        // Home may be unknown (no HOME, no passwd entry); the rest still holds.
        try {
            info["home_dir"] = paths.home_dir().generic_string();
            info["config_dir"] = paths.devflow_home().generic_string();
        } catch (const PathResolutionError& e) {
            info["home_dir"] = nullptr;
            info["config_dir"] = nullptr;
            info["warning"] = e.what();
        }
        return info;
    });

    entries.emplace_back("paths", [paths](const Json& params) -> HandlerResult {
        const auto target = optional_param<std::string>(params, "mount_target",
                                                        std::string(kDockerSocketMountTarget));
        Json resolved = Json::object();
        for (ResourceKind kind : kAllResources) {
            // A missing home directory surfaces as a handler error (-32000).
            resolved[std::string(to_string(kind))] = paths.resolve(kind, target);
        }
        return resolved;
    });

    entries.emplace_back("tools", [paths](const Json&) -> HandlerResult {
        Json tools = Json::array();
        for (Tool tool : kAllTools) {
            const auto found = paths.find_tool(tool);
            tools.push_back({
                {"name", std::string(tool_base_name(tool))},
                {"binary", paths.tool_binary(tool)},
                {"path", found ? Json(found->generic_string()) : Json(nullptr)}
            });
        }
        return tools;
    });

    return entries;
}

}  // namespace devflow
