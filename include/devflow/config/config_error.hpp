#pragma once

#include <tl/expected.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace devflow {

/// Failure reading or writing one of the JSON settings files
/// (service.json, bridge.json) or applying an override.
struct ConfigError {
    enum class Code {
        Unreadable,    // exists but cannot be opened or read
        Malformed,     // not JSON, or wrong shape
        InvalidValue,  // well-formed but out of range (port 70000, level "loud")
        WriteFailed
    };

    Code code{Code::Malformed};
    std::string message;
    std::filesystem::path path{};

    [[nodiscard]] static ConfigError unreadable(const std::filesystem::path& file, std::string_view why) {
        return {Code::Unreadable, "Cannot read " + file.string() + ": " + std::string(why), file};
    }

    [[nodiscard]] static ConfigError malformed(const std::filesystem::path& file, std::string_view why) {
        return {Code::Malformed, "Malformed " + file.string() + ": " + std::string(why), file};
    }

    [[nodiscard]] static ConfigError invalid_value(std::string_view what) {
        return {Code::InvalidValue, std::string(what), {}};
    }

    [[nodiscard]] static ConfigError write_failed(const std::filesystem::path& file, std::string_view why) {
        return {Code::WriteFailed, "Cannot write " + file.string() + ": " + std::string(why), file};
    }
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

}  // namespace devflow
