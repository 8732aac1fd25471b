#pragma once

#include <string_view>

#define DEVFLOW_VERSION_MAJOR 0
#define DEVFLOW_VERSION_MINOR 4
#define DEVFLOW_VERSION_PATCH 0

namespace devflow {

inline constexpr std::string_view kVersion = "0.4.0";

}  // namespace devflow
