#pragma once

#include "devflow/log/logger.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace devflow {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────
// ILogger backed by spdlog. Console output goes to stderr: in stdio bridge
// mode stdout carries the RPC stream and must never see log lines.

class SpdlogLogger final : public ILogger {
public:
    /// Colored stderr sink
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    /// Wrap an existing spdlog logger
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level);

    ~SpdlogLogger() override = default;

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;
    SpdlogLogger(SpdlogLogger&&) = delete;
    SpdlogLogger& operator=(SpdlogLogger&&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;
    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Sink configuration used by the service and the CLI
// ─────────────────────────────────────────────────────────────────────────────

struct LogSinkConfig {
    LogLevel level{LogLevel::Info};
    bool console{true};
    std::optional<std::filesystem::path> file{};
};

/// Build a logger for `config`. Throws spdlog::spdlog_ex if the file sink
/// cannot be opened.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_logger(const LogSinkConfig& config);

}  // namespace devflow
