#pragma once

#include "devflow/config/config_error.hpp"
#include "devflow/transport.hpp"

#include <filesystem>
#include <optional>

namespace devflow {

/// Parsed contents of `file`, or empty if the file does not exist.
[[nodiscard]] ConfigResult<std::optional<Json>> read_json_file(const std::filesystem::path& file);

/// Pretty-printed write through a sibling temporary file and a rename, so
/// readers never see a half-written document.
ConfigResult<void> write_json_file(const std::filesystem::path& file, const Json& document);

}  // namespace devflow
