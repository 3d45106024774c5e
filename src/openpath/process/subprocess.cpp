// Copyright (c) 2026 changcheng967. All rights reserved.

#include <openpath/process/subprocess.hpp>
#include <array>
#include <cerrno>
#include <csignal>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace openpath::process {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int EXEC_FAILED_EXIT = 127;

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ != -1; }

    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ != -1) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

struct Pipe {
    UniqueFd read;
    UniqueFd write;
};

std::error_code last_error() noexcept {
    return {errno, std::system_category()};
}

std::expected<Pipe, std::error_code> make_pipe() noexcept {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        return std::unexpected(make_error_code(ProcessErrc::pipe_failed));
    }
    return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

int decode_status(int status) noexcept {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::chrono::milliseconds remaining(Clock::time_point deadline) noexcept {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds{0};
}

// Kill the whole process group so helpers spawned by a script die too
void kill_and_reap(pid_t pid) noexcept {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
}

// Runs in the forked child; only async-signal-safe calls from here on
[[noreturn]] void exec_child(const char* path, char* const argv[],
                             int out_fd, int err_fd, int report_fd) noexcept {
    ::setpgid(0, 0);

    // An ignored SIGPIPE would survive exec; children get the default back
    ::signal(SIGPIPE, SIG_DFL);

    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull != -1) {
        ::dup2(devnull, STDIN_FILENO);
    }
    if (::dup2(out_fd, STDOUT_FILENO) == -1 || ::dup2(err_fd, STDERR_FILENO) == -1) {
        int err = errno;
        (void)!::write(report_fd, &err, sizeof(err));
        ::_exit(EXEC_FAILED_EXIT);
    }

    ::execv(path, argv);

    int err = errno;
    (void)!::write(report_fd, &err, sizeof(err));
    ::_exit(EXEC_FAILED_EXIT);
}

// Drains both pipes until EOF or deadline. Returns false on timeout.
bool drain(UniqueFd& out_fd, UniqueFd& err_fd, ProcessResult& result,
           Clock::time_point deadline) noexcept {
    std::array<char, 8192> buffer{};

    while (out_fd.valid() || err_fd.valid()) {
        std::array<pollfd, 2> fds = {{
            {out_fd.get(), POLLIN, 0},
            {err_fd.get(), POLLIN, 0},
        }};

        auto wait = remaining(deadline);
        if (wait.count() == 0) {
            return false;
        }

        int ready = ::poll(fds.data(), fds.size(), static_cast<int>(wait.count()));
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        if (ready == 0) {
            return false;
        }

        auto pump = [&](pollfd& pfd, UniqueFd& fd, std::string& sink) {
            if (!fd.valid() || (pfd.revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                return;
            }
            ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
            if (n > 0) {
                sink.append(buffer.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fd.reset();
            }
        };

        pump(fds[0], out_fd, result.out);
        pump(fds[1], err_fd, result.err);
    }

    return true;
}

} // namespace

ProcessOutcome run_process(const std::filesystem::path& command,
                           const std::vector<std::string>& args,
                           std::chrono::milliseconds timeout) noexcept {
    try {
        const auto deadline = Clock::now() + timeout;

        auto out_pipe = make_pipe();
        auto err_pipe = make_pipe();
        auto report_pipe = make_pipe();
        if (!out_pipe || !err_pipe || !report_pipe) {
            return std::unexpected(make_error_code(ProcessErrc::pipe_failed));
        }

        // argv is built before fork; the child must not allocate
        const std::string path = command.string();
        std::vector<std::string> arg_storage;
        arg_storage.reserve(args.size() + 1);
        arg_storage.push_back(path);
        arg_storage.insert(arg_storage.end(), args.begin(), args.end());

        std::vector<char*> argv;
        argv.reserve(arg_storage.size() + 1);
        for (auto& a : arg_storage) {
            argv.push_back(a.data());
        }
        argv.push_back(nullptr);

        const pid_t pid = ::fork();
        if (pid == -1) {
            return std::unexpected(last_error());
        }

        if (pid == 0) {
            exec_child(path.c_str(), argv.data(),
                       out_pipe->write.get(), err_pipe->write.get(),
                       report_pipe->write.get());
        }

        ::setpgid(pid, pid);

        out_pipe->write.reset();
        err_pipe->write.reset();
        report_pipe->write.reset();

        // The report pipe is close-on-exec: EOF means exec succeeded
        int exec_errno = 0;
        ssize_t n;
        do {
            n = ::read(report_pipe->read.get(), &exec_errno, sizeof(exec_errno));
        } while (n == -1 && errno == EINTR);

        if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
            int status = 0;
            while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
            }
            return std::unexpected(std::error_code(exec_errno, std::system_category()));
        }

        ProcessResult result;
        if (!drain(out_pipe->read, err_pipe->read, result, deadline)) {
            kill_and_reap(pid);
            return std::unexpected(make_error_code(ProcessErrc::timed_out));
        }

        // Output is closed; give the child the rest of the budget to exit
        int status = 0;
        while (true) {
            const pid_t waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                break;
            }
            if (waited == -1 && errno != EINTR) {
                return std::unexpected(make_error_code(ProcessErrc::wait_failed));
            }
            if (remaining(deadline).count() == 0) {
                kill_and_reap(pid);
                return std::unexpected(make_error_code(ProcessErrc::timed_out));
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        result.exit_code = decode_status(status);
        return result;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(ProcessErrc::launch_failed));
    }
}

ProcessOutcome SubprocessRunner::run(const std::filesystem::path& command,
                                     const std::vector<std::string>& args,
                                     std::chrono::milliseconds timeout) noexcept {
    return run_process(command, args, timeout);
}

} // namespace openpath::process
