#include "devflow/log/logger.hpp"

#include <algorithm>
#include <cctype>

namespace devflow {

namespace {

[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        const auto lhs = std::tolower(static_cast<unsigned char>(a[i]));
        const auto rhs = std::tolower(static_cast<unsigned char>(b[i]));
        if (lhs != rhs) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    constexpr LogLevel all_levels[] = {
        LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
        LogLevel::Error, LogLevel::Fatal, LogLevel::Off
    };
    for (const auto level : all_levels) {
        if (iequals(name, to_string(level))) {
            return level;
        }
    }
    if (iequals(name, "warning")) {
        return LogLevel::Warn;
    }
    if (iequals(name, "critical")) {
        return LogLevel::Fatal;
    }
    return std::nullopt;
}

bool RecordingLogger::contains(LogLevel level, std::string_view needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(records_.begin(), records_.end(), [&](const LogRecord& record) {
        const bool level_matches =
            static_cast<std::uint8_t>(record.level) >= static_cast<std::uint8_t>(level);
        return level_matches && (record.message.find(needle) != std::string::npos);
    });
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Singleton
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& logger_instance() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_instance();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (logger != nullptr) {
        logger_instance() = std::move(logger);
    } else {
        logger_instance() = std::make_unique<NullLogger>();
    }
}

}  // namespace devflow
