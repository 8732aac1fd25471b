#include "devflow/transport/pipe_transport.hpp"
#include "devflow/log/logger.hpp"

#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace devflow {

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(10);

TransportError spawn_error(const std::string& what, int err) {
    return TransportError{
        TransportError::Category::Network,
        what + ": " + std::strerror(err),
        err
    };
}

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool set_cloexec(int fd) noexcept {
    const int flags = ::fcntl(fd, F_GETFD);
    return flags != -1 && ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) != -1;
}

// Pipe whose both ends are close-on-exec in the parent.
bool make_pipe(int fds[2]) noexcept {
    if (::pipe(fds) == -1) {
        return false;
    }
    if (!set_cloexec(fds[0]) || !set_cloexec(fds[1])) {
        ::close(fds[0]);
        ::close(fds[1]);
        return false;
    }
    return true;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// PipeTransport
// ═══════════════════════════════════════════════════════════════════════════

PipeTransport::PipeTransport(asio::any_io_executor executor, int read_fd, int write_fd,
                             FramedTransportConfig config)
    : PipeTransport(std::move(executor), config)
{
    assign_descriptors(read_fd, write_fd);
}

PipeTransport::PipeTransport(asio::any_io_executor executor, FramedTransportConfig config)
    : FramedTransport(executor, config)
    , reader_(executor)
    , writer_(executor)
{}

void PipeTransport::assign_descriptors(int read_fd, int write_fd) {
    read_fd_ = read_fd;
    write_fd_ = write_fd;
    reader_.assign(read_fd);
    writer_.assign(write_fd);
}

std::string PipeTransport::describe() const {
    return "pipe(r=" + std::to_string(read_fd_) + ",w=" + std::to_string(write_fd_) + ")";
}

asio::awaitable<TransportResult<void>> PipeTransport::open_streams() {
    if (reader_.is_open() == false || writer_.is_open() == false) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Network,
            "Pipe descriptors are not open",
            std::nullopt
        });
    }
    co_return TransportResult<void>{};
}

asio::awaitable<std::size_t> PipeTransport::read_some(asio::mutable_buffer buffer) {
    co_return co_await reader_.async_read_some(buffer, asio::use_awaitable);
}

asio::awaitable<void> PipeTransport::write_all(asio::const_buffer buffer) {
    co_await asio::async_write(writer_, buffer, asio::use_awaitable);
}

void PipeTransport::close_streams() noexcept {
    asio::error_code ignored;
    if (writer_.is_open()) {
        writer_.close(ignored);
    }
    if (reader_.is_open()) {
        reader_.close(ignored);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// ProcessTransport
// ═══════════════════════════════════════════════════════════════════════════

ProcessTransport::ProcessTransport(asio::any_io_executor executor, SubprocessOptions options,
                                   FramedTransportConfig config)
    : PipeTransport(std::move(executor), config)
    , options_(std::move(options))
{}

ProcessTransport::~ProcessTransport() {
    PipeTransport::close_streams();
    reap_child();
}

std::string ProcessTransport::describe() const {
    return options_.command + " (pid " + std::to_string(child_pid_) + ")";
}

asio::awaitable<TransportResult<void>> ProcessTransport::open_streams() {
    if (options_.command.empty()) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Network,
            "No command given for subprocess transport",
            std::nullopt
        });
    }

    auto spawned = spawn();
    if (!spawned) {
        co_return spawned;
    }
    co_return co_await PipeTransport::open_streams();
}

TransportResult<void> ProcessTransport::spawn() {
    // Everything the child touches is prepared before fork(): only
    // async-signal-safe calls are allowed between fork() and exec.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(options_.args.size() + 1);
    argv_storage.push_back(options_.command);
    argv_storage.insert(argv_storage.end(), options_.args.begin(), options_.args.end());

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const std::string working_dir = options_.working_dir.has_value() ? options_.working_dir->string() : "";
    const bool discard_stderr = (options_.stderr_handling == StderrHandling::Discard);

    int to_child[2] = {-1, -1};
    int from_child[2] = {-1, -1};
    int exec_status[2] = {-1, -1};

    if (!make_pipe(to_child) || !make_pipe(from_child) || !make_pipe(exec_status)) {
        const int err = errno;
        close_fd(to_child[0]);
        close_fd(to_child[1]);
        close_fd(from_child[0]);
        close_fd(from_child[1]);
        return tl::unexpected(spawn_error("Failed to create pipes", err));
    }

    const pid_t pid = ::fork();
    if (pid == -1) {
        const int err = errno;
        for (int* fds : {to_child, from_child, exec_status}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return tl::unexpected(spawn_error("Failed to fork", err));
    }

    if (pid == 0) {
        ::dup2(to_child[0], STDIN_FILENO);
        ::dup2(from_child[1], STDOUT_FILENO);
        if (discard_stderr) {
            const int devnull = ::open("/dev/null", O_WRONLY);
            if (devnull != -1) {
                ::dup2(devnull, STDERR_FILENO);
                ::close(devnull);
            }
        }
        if (working_dir.empty() == false && ::chdir(working_dir.c_str()) == -1) {
            const int err = errno;
            [[maybe_unused]] auto n = ::write(exec_status[1], &err, sizeof(err));
            ::_exit(127);
        }
        ::execvp(argv[0], argv.data());
        const int err = errno;
        [[maybe_unused]] auto n = ::write(exec_status[1], &err, sizeof(err));
        ::_exit(127);
    }

    close_fd(to_child[0]);
    close_fd(from_child[1]);
    close_fd(exec_status[1]);

    // exec_status is close-on-exec: EOF means exec succeeded, an int means
    // the child reported errno before exiting.
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_status[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    close_fd(exec_status[0]);

    child_pid_ = pid;

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        close_fd(to_child[1]);
        close_fd(from_child[0]);
        reap_child();
        return tl::unexpected(spawn_error("Failed to start '" + options_.command + "'", child_errno));
    }

    assign_descriptors(from_child[0], to_child[1]);
    DEVFLOW_LOG_INFO("Spawned {} (pid {})", options_.command, pid);
    return {};
}

void ProcessTransport::close_streams() noexcept {
    PipeTransport::close_streams();
    reap_child();
}

void ProcessTransport::reap_child() noexcept {
    if (child_pid_ <= 0) {
        return;
    }

    // Stdin is closed by now; a well-behaved server exits on EOF.
    auto wait_for_exit = [this](std::chrono::milliseconds budget) {
        const auto deadline = std::chrono::steady_clock::now() + budget;
        while (true) {
            int status = 0;
            const pid_t rc = ::waitpid(child_pid_, &status, WNOHANG);
            if (rc == child_pid_) {
                if (WIFEXITED(status)) {
                    exit_code_ = WEXITSTATUS(status);
                } else if (WIFSIGNALED(status)) {
                    exit_code_ = -WTERMSIG(status);
                }
                return true;
            }
            if (rc == -1) {
                return true;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(kReapPollInterval);
        }
    };

    if (wait_for_exit(options_.exit_grace) == false) {
        ::kill(child_pid_, SIGTERM);
        if (wait_for_exit(options_.exit_grace) == false) {
            ::kill(child_pid_, SIGKILL);
            wait_for_exit(std::chrono::seconds(5));
        }
    }

    DEVFLOW_LOG_DEBUG("Child {} exited with {}", child_pid_, exit_code_.value_or(-1));
    child_pid_ = -1;
}

}  // namespace devflow
