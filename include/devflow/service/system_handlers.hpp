#pragma once

#include "devflow/platform/path_resolver.hpp"
#include "devflow/server/handler_registry.hpp"

#include <vector>

namespace devflow {

/// The "system" method group every service exposes:
///
///   system.ping     {"pong": true, "version": "..."}
///   system.version  {"devflow", "compiler", "platform"}
///   system.info     {"platform", "version", "pid", "home_dir", "config_dir"}
///   system.paths    every ResourceKind resolved for this platform
///   system.tools    each wrapped CLI tool with its executable name and the
///                   PATH match, or null
///
/// Handlers copy `paths`; nothing here touches shared state.
[[nodiscard]] std::vector<HandlerRegistry::Entry> system_handlers(const PathResolver& paths);

}  // namespace devflow
