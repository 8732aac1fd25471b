#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Platform Detection
// ═══════════════════════════════════════════════════════════════════════════
// Classifies the running process as native Linux, macOS, Windows, or a Linux
// guest under WSL2. The classification is made once per process; everything
// else receives it through a PlatformProvider value.

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace devflow {

enum class Platform : std::uint8_t {
    Linux,
    MacOS,
    Windows,
    WSL2
};

/// Stable lowercase name, as reported by system.info and written to logs.
[[nodiscard]] constexpr std::string_view to_string(Platform platform) noexcept {
    switch (platform) {
        case Platform::Linux:   return "linux";
        case Platform::MacOS:   return "darwin";
        case Platform::Windows: return "windows";
        case Platform::WSL2:    return "wsl2";
    }
    return "unknown";
}

/// Raised when the OS cannot be mapped to a Platform. Callers are expected to
/// let it abort startup.
class UnsupportedPlatformError : public std::runtime_error {
public:
    explicit UnsupportedPlatformError(const std::string& os_name)
        : std::runtime_error("Unsupported platform: " + os_name)
        , os_name_(os_name)
    {}

    [[nodiscard]] const std::string& os_name() const noexcept { return os_name_; }

private:
    std::string os_name_;
};

/// Pure classification step.
/// `os_family` is the kernel/OS name ("Linux", "Darwin", "Windows", as
/// reported by uname sysname or the build target); `kernel_release` is the
/// kernel release string (uname release). Matching is case-insensitive.
[[nodiscard]] Platform classify_platform(std::string_view os_family, std::string_view kernel_release);

/// Inspect the live system. Throws UnsupportedPlatformError.
[[nodiscard]] Platform detect_platform();

/// First detection result for this process (thread-safe, computed once).
[[nodiscard]] Platform current_platform();

// ─────────────────────────────────────────────────────────────────────────────
// PlatformProvider
// ─────────────────────────────────────────────────────────────────────────────

class PlatformProvider {
public:
    constexpr explicit PlatformProvider(Platform platform) noexcept
        : platform_(platform)
    {}

    /// Provider for the running process.
    [[nodiscard]] static PlatformProvider detected() {
        return PlatformProvider(current_platform());
    }

    [[nodiscard]] constexpr Platform platform() const noexcept { return platform_; }

    [[nodiscard]] constexpr bool is_wsl() const noexcept { return platform_ == Platform::WSL2; }
    [[nodiscard]] constexpr bool is_wsl2() const noexcept { return is_wsl(); }
    [[nodiscard]] constexpr bool is_windows() const noexcept { return platform_ == Platform::Windows; }
    [[nodiscard]] constexpr bool is_macos() const noexcept { return platform_ == Platform::MacOS; }

    /// Native Linux only; a WSL2 guest is not "linux" here.
    [[nodiscard]] constexpr bool is_linux() const noexcept { return platform_ == Platform::Linux; }

    [[nodiscard]] constexpr bool is_unix_like() const noexcept { return is_windows() == false; }

    [[nodiscard]] constexpr std::string_view name() const noexcept { return to_string(platform_); }

    [[nodiscard]] constexpr bool operator==(const PlatformProvider&) const noexcept = default;

private:
    Platform platform_;
};

}  // namespace devflow
