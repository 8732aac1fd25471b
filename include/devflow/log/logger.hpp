#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace devflow {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "fatal";
        case LogLevel::Off:   return "off";
    }
    return "unknown";
}

/// Parse a level name as given on the command line or in config files.
/// Accepts the names produced by to_string() plus "warning" and "critical",
/// case-insensitively.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(
        LogLevel level,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) {
        if (should_log(level)) {
            log(LogRecord(level, std::move(message), loc));
        }
    }
};

// Discards everything. Installed until a process configures logging.
class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// RecordingLogger - keeps records in memory (tests, diagnostics dumps)
// ─────────────────────────────────────────────────────────────────────────────

class RecordingLogger final : public ILogger {
public:
    explicit RecordingLogger(LogLevel min_level = LogLevel::Trace)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    [[nodiscard]] std::vector<LogRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    /// True if any record at `level` or above contains `needle`.
    [[nodiscard]] bool contains(LogLevel level, std::string_view needle) const;

private:
    LogLevel min_level_;
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] ILogger& get_logger() noexcept;

// Replace the process logger. Passing nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// Formatting macros. Arguments are only evaluated when the level is enabled.

#define DEVFLOW_LOG_AT(lvl, ...) \
    do { if (::devflow::get_logger().should_log(lvl)) \
         ::devflow::get_logger().write(lvl, std::format(__VA_ARGS__)); } while(false)

#define DEVFLOW_LOG_TRACE(...) DEVFLOW_LOG_AT(::devflow::LogLevel::Trace, __VA_ARGS__)
#define DEVFLOW_LOG_DEBUG(...) DEVFLOW_LOG_AT(::devflow::LogLevel::Debug, __VA_ARGS__)
#define DEVFLOW_LOG_INFO(...)  DEVFLOW_LOG_AT(::devflow::LogLevel::Info, __VA_ARGS__)
#define DEVFLOW_LOG_WARN(...)  DEVFLOW_LOG_AT(::devflow::LogLevel::Warn, __VA_ARGS__)
#define DEVFLOW_LOG_ERROR(...) DEVFLOW_LOG_AT(::devflow::LogLevel::Error, __VA_ARGS__)
#define DEVFLOW_LOG_FATAL(...) DEVFLOW_LOG_AT(::devflow::LogLevel::Fatal, __VA_ARGS__)

}  // namespace devflow
