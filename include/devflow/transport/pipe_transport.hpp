#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Pipe and Subprocess Transports (POSIX)
// ═══════════════════════════════════════════════════════════════════════════
// PipeTransport speaks over a pair of file descriptors; the server uses it to
// serve its own stdin/stdout. ProcessTransport spawns a child and speaks over
// the child's stdin/stdout.

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "PipeTransport is only available on POSIX-compatible systems"
#endif

#include "devflow/transport/framed_transport.hpp"

#include <asio/posix/stream_descriptor.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace devflow {

class PipeTransport : public FramedTransport {
public:
    /// Takes ownership of both descriptors.
    PipeTransport(asio::any_io_executor executor, int read_fd, int write_fd,
                  FramedTransportConfig config = {});

    [[nodiscard]] std::string describe() const override;

protected:
    PipeTransport(asio::any_io_executor executor, FramedTransportConfig config);

    void assign_descriptors(int read_fd, int write_fd);

    [[nodiscard]] asio::awaitable<TransportResult<void>> open_streams() override;
    [[nodiscard]] asio::awaitable<std::size_t> read_some(asio::mutable_buffer buffer) override;
    [[nodiscard]] asio::awaitable<void> write_all(asio::const_buffer buffer) override;
    void close_streams() noexcept override;

private:
    asio::posix::stream_descriptor reader_;
    asio::posix::stream_descriptor writer_;
    int read_fd_{-1};
    int write_fd_{-1};
};

// ─────────────────────────────────────────────────────────────────────────────
// ProcessTransport
// ─────────────────────────────────────────────────────────────────────────────

enum class StderrHandling {
    Inherit,  // child writes to our stderr
    Discard   // child stderr goes to /dev/null
};

struct SubprocessOptions {
    std::string command;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> working_dir{};
    StderrHandling stderr_handling{StderrHandling::Inherit};

    /// After our end of stdin is closed, how long the child gets to exit
    /// before SIGTERM (and then SIGKILL after the same interval).
    std::chrono::milliseconds exit_grace{std::chrono::milliseconds(500)};
};

class ProcessTransport final : public PipeTransport {
public:
    ProcessTransport(asio::any_io_executor executor, SubprocessOptions options,
                     FramedTransportConfig config = {});
    ~ProcessTransport() override;

    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] pid_t child_pid() const noexcept { return child_pid_; }

    /// Exit status once reaped: exit code, or minus the terminating signal.
    [[nodiscard]] std::optional<int> exit_code() const noexcept { return exit_code_; }

protected:
    [[nodiscard]] asio::awaitable<TransportResult<void>> open_streams() override;
    void close_streams() noexcept override;

private:
    TransportResult<void> spawn();
    void reap_child() noexcept;

    SubprocessOptions options_;
    pid_t child_pid_{-1};
    std::optional<int> exit_code_;
};

[[nodiscard]] inline std::shared_ptr<ProcessTransport> make_process_transport(
    asio::any_io_executor executor,
    SubprocessOptions options,
    FramedTransportConfig config = {}
) {
    return std::make_shared<ProcessTransport>(std::move(executor), std::move(options), config);
}

}  // namespace devflow
