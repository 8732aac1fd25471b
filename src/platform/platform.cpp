#include "devflow/platform/platform.hpp"
#include "devflow/log/logger.hpp"

#include <algorithm>
#include <cctype>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/utsname.h>
#endif

namespace devflow {

namespace {

[[nodiscard]] std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

struct OsSignature {
    std::string family;
    std::string release;
};

OsSignature read_os_signature() {
#if defined(_WIN32)
    return OsSignature{"windows", {}};
#elif defined(__unix__) || defined(__APPLE__)
    struct utsname info {};
    if (::uname(&info) != 0) {
        throw UnsupportedPlatformError("uname() failed");
    }
    return OsSignature{info.sysname, info.release};
#else
    return OsSignature{"unknown", {}};
#endif
}

}  // namespace

Platform classify_platform(std::string_view os_family, std::string_view kernel_release) {
    const std::string family = to_lower(os_family);

    if (family == "linux") {
        const std::string release = to_lower(kernel_release);
        const bool wsl_kernel = (release.find("microsoft") != std::string::npos)
                             || (release.find("wsl") != std::string::npos);
        return wsl_kernel ? Platform::WSL2 : Platform::Linux;
    }
    if (family == "darwin") {
        return Platform::MacOS;
    }
    if (family == "windows" || family.starts_with("mingw") || family.starts_with("msys")
        || family.starts_with("cygwin")) {
        return Platform::Windows;
    }
    throw UnsupportedPlatformError(std::string(os_family));
}

Platform detect_platform() {
    const OsSignature signature = read_os_signature();
    const Platform platform = classify_platform(signature.family, signature.release);
    DEVFLOW_LOG_DEBUG("Detected platform {} (sysname={}, release={})",
                      to_string(platform), signature.family, signature.release);
    return platform;
}

Platform current_platform() {
    static const Platform platform = detect_platform();
    return platform;
}

}  // namespace devflow
