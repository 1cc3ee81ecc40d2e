#include <iojudge/subprocess/subprocess.hpp>

#include <iojudge/common/error_types.hpp>
#include <iojudge/common/expected.hpp>
#include <iojudge/common/linux.hpp>
#include <iojudge/common/which.hpp>
#include <iojudge/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/ioctl.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

namespace iojudge {

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 4096;
constexpr std::size_t PROC_STAT_READ_SIZE = 512;
/// Well below the n_tty canonical line limit (N_TTY_BUF_SIZE - 1)
constexpr std::size_t TERMINAL_LINE_CHUNK = 1024;
constexpr int MAX_EXEC_ATTEMPTS = 16;
constexpr int CHILD_SETUP_FAILED = 127;

/// Writes to the pipe of a child which has exited must not terminate the judge
void ignore_sigpipe() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

/// Reports `err` to the parent through the exec error pipe and exits. Async-signal-safe
[[noreturn]] void child_die(int error_fd, int err) {
    ssize_t res = ::write(error_fd, &err, sizeof(err));
    (void)res;
    ::_exit(CHILD_SETUP_FAILED);
}

std::vector<char*> to_cstr_list(std::vector<std::string>& strs) {
    std::vector<char*> result;
    result.reserve(strs.size() + 1);

    for (std::string& str : strs) {
        result.push_back(str.data());
    }
    result.push_back(nullptr);

    return result;
}

} // namespace

Subprocess::Subprocess(std::string exec, std::vector<std::string> args, SubprocessOptions options)
    : exec_{std::move(exec)}
    , args_{std::move(args)}
    , options_{std::move(options)} {}

Subprocess::~Subprocess() {
    // if child_pid_ == 0, then the process was never started, or the object was moved from
    if (is_alive()) {
        if (auto res = terminate(); !res) {
            LOG_WARN("Failed to terminate child process {}: {}", child_pid_, res.error());
        }
    }

    close_fds();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : exec_{std::move(other.exec_)}
    , args_{std::move(other.args_)}
    , options_{std::move(other.options_)}
    , child_pid_{std::exchange(other.child_pid_, 0)}
    , run_result_{std::exchange(other.run_result_, std::nullopt)}
    , input_fd_{std::exchange(other.input_fd_, -1)}
    , output_fd_{std::exchange(other.output_fd_, -1)}
    , child_stdin_fd_{std::exchange(other.child_stdin_fd_, -1)}
    , child_stdout_fd_{std::exchange(other.child_stdout_fd_, -1)}
    , eof_char_{other.eof_char_}
    , stdout_buffer_{std::exchange(other.stdout_buffer_, {})}
    , stdout_cursor_{std::exchange(other.stdout_cursor_, 0)} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    if (this == &rhs) {
        return *this;
    }

    if (is_alive()) {
        if (auto res = terminate(); !res) {
            LOG_WARN("Failed to terminate child process {}: {}", child_pid_, res.error());
        }
    }
    close_fds();

    exec_ = std::move(rhs.exec_);
    args_ = std::move(rhs.args_);
    options_ = std::move(rhs.options_);
    child_pid_ = std::exchange(rhs.child_pid_, 0);
    run_result_ = std::exchange(rhs.run_result_, std::nullopt);
    input_fd_ = std::exchange(rhs.input_fd_, -1);
    output_fd_ = std::exchange(rhs.output_fd_, -1);
    child_stdin_fd_ = std::exchange(rhs.child_stdin_fd_, -1);
    child_stdout_fd_ = std::exchange(rhs.child_stdout_fd_, -1);
    eof_char_ = rhs.eof_char_;
    stdout_buffer_ = std::exchange(rhs.stdout_buffer_, {});
    stdout_cursor_ = std::exchange(rhs.stdout_cursor_, 0);

    return *this;
}

Result<void> Subprocess::start() {
    ASSERT(child_pid_ == 0, "Subprocess may only be started once");

    ignore_sigpipe();

    std::optional<std::string> resolved = which(exec_);
    if (!resolved) {
        LOG_DEBUG("Executable {:?} not found", exec_);
        return ErrorKind::ExecFailure;
    }

    if (options_.channel == ChannelKind::Terminal) {
        TRY(create_terminal());
    } else {
        TRY(create_pipes());
    }

    // Everything the child needs is prepared before forking; the child must not allocate
    std::vector<std::string> argv_strs{*resolved};
    argv_strs.insert(argv_strs.end(), args_.begin(), args_.end());
    std::vector<char*> argv = to_cstr_list(argv_strs);
    std::vector<char*> envp = to_cstr_list(options_.env);

    linux::Pipe error_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);

    LOG_DEBUG("Launching {} {} ({} channel)", *resolved, fmt::join(args_, " "), options_.channel);

    auto fork_res = linux::fork();

    if (!fork_res) {
        std::ignore = linux::close(error_pipe.read_fd);
        std::ignore = linux::close(error_pipe.write_fd);
        close_fds();
        return ErrorKind::SyscallFailure;
    }

    // Child process
    if (fork_res.value().which == linux::Fork::Child) {
        ::close(error_pipe.read_fd);
        exec_child(resolved->c_str(), argv.data(), envp.data(), error_pipe.write_fd);
    }

    // Parent process
    child_pid_ = fork_res.value().pid;

    TRYE(linux::close(error_pipe.write_fd), SyscallFailure);

    // The write end is close-on-exec, so a successful exec produces EOF
    auto error_report = linux::read(error_pipe.read_fd, sizeof(int));
    TRYE(linux::close(error_pipe.read_fd), SyscallFailure);

    if (error_report && error_report.value().size() == sizeof(int)) {
        int child_errno{};
        std::memcpy(&child_errno, error_report.value().data(), sizeof(int));

        LOG_DEBUG("Child failed to exec {:?}: {}", *resolved, get_err_msg(child_errno));

        auto waited = TRYE(linux::wait4(child_pid_), SyscallFailure);
        run_result_ = RunResult::from_wait_status(waited.status, waited.usage);
        close_fds();

        return ErrorKind::ExecFailure;
    }

    return init_parent();
}

void Subprocess::exec_child(const char* exec, char* const* argv, char* const* envp, int error_fd) {
    ::signal(SIGPIPE, SIG_DFL);

    // New session, so that the whole process tree can be killed through the process group
    if (::setsid() == -1) {
        child_die(error_fd, errno);
    }

    if (options_.channel == ChannelKind::Terminal) {
        if (::ioctl(child_stdin_fd_, TIOCSCTTY, 0) == -1) {
            child_die(error_fd, errno);
        }
        for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
            if (::dup2(child_stdin_fd_, fd) == -1) {
                child_die(error_fd, errno);
            }
        }
    } else {
        int stderr_fd = child_stdout_fd_;
        if (!options_.merge_stderr) {
            // NOLINTNEXTLINE(*vararg)
            stderr_fd = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
        }

        if (stderr_fd == -1 || ::dup2(child_stdin_fd_, STDIN_FILENO) == -1 ||
            ::dup2(child_stdout_fd_, STDOUT_FILENO) == -1 || ::dup2(stderr_fd, STDERR_FILENO) == -1) {
            child_die(error_fd, errno);
        }
    }

    if (!options_.workdir.empty() && ::chdir(options_.workdir.c_str()) == -1) {
        child_die(error_fd, errno);
    }

    const IsolationLimits& limits = options_.limits;
    rlimit rlim{};

#define SET_RLIM(res, soft, hard)                                                                                      \
    {                                                                                                                  \
        rlim_t lim = soft;                                                                                             \
        if (lim) {                                                                                                     \
            rlim.rlim_cur = lim;                                                                                       \
            rlim.rlim_max = hard;                                                                                      \
            if (::setrlimit(RLIMIT_##res, &rlim) < 0) {                                                                \
                child_die(error_fd, errno);                                                                            \
            }                                                                                                          \
        }                                                                                                              \
    }

    const auto cpu_seconds = static_cast<rlim_t>((limits.cpu_time.count() + 999) / 1000);

    SET_RLIM(AS, limits.memory_bytes, limits.memory_bytes);
    // SIGXCPU at the soft limit, SIGKILL one second later
    SET_RLIM(CPU, cpu_seconds, cpu_seconds + 1);
    SET_RLIM(FSIZE, limits.file_size_bytes, limits.file_size_bytes);
#undef SET_RLIM

    int attempts = 0;
    do {
        ::execve(exec, argv, envp);
        ::usleep(100);
    } while (errno == ETXTBSY && ++attempts < MAX_EXEC_ATTEMPTS);

    child_die(error_fd, errno);
}

Result<void> Subprocess::create_pipes() {
    auto stdin_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    child_stdin_fd_ = stdin_pipe.read_fd;
    input_fd_ = stdin_pipe.write_fd;

    auto stdout_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    child_stdout_fd_ = stdout_pipe.write_fd;
    output_fd_ = stdout_pipe.read_fd;

    return {};
}

Result<void> Subprocess::create_terminal() {
    int master = ::posix_openpt(O_RDWR | O_NOCTTY | O_CLOEXEC);

    if (master == -1) {
        LOG_DEBUG("posix_openpt failed: '{}'", get_err_msg());
        return ErrorKind::SyscallFailure;
    }

    input_fd_ = master;
    output_fd_ = master;

    std::array<char, 128> slave_name{};

    if (::grantpt(master) == -1 || ::unlockpt(master) == -1 ||
        ::ptsname_r(master, slave_name.data(), slave_name.size()) != 0) {
        LOG_DEBUG("pseudo-terminal setup failed: '{}'", get_err_msg());
        return ErrorKind::SyscallFailure;
    }

    int slave = TRYE(linux::open(slave_name.data(), O_RDWR | O_NOCTTY | O_CLOEXEC), SyscallFailure);
    child_stdin_fd_ = slave;
    child_stdout_fd_ = slave;

    termios attrs{};
    if (::tcgetattr(slave, &attrs) == -1) {
        LOG_DEBUG("tcgetattr failed: '{}'", get_err_msg());
        return ErrorKind::SyscallFailure;
    }

    // Line-buffered input, but nothing written to the terminal is echoed back or translated,
    // and control characters neither raise signals nor edit the line
    attrs.c_lflag |= ICANON;
    attrs.c_lflag &= ~static_cast<tcflag_t>(ECHO | ECHOE | ECHOK | ECHONL | ISIG | IEXTEN);
    attrs.c_iflag &= ~static_cast<tcflag_t>(ICRNL | INLCR | IGNCR | IXON | IXOFF);
    attrs.c_oflag &= ~static_cast<tcflag_t>(OPOST);
    attrs.c_cc[VERASE] = _POSIX_VDISABLE;
    attrs.c_cc[VKILL] = _POSIX_VDISABLE;

    if (::tcsetattr(slave, TCSANOW, &attrs) == -1) {
        LOG_DEBUG("tcsetattr failed: '{}'", get_err_msg());
        return ErrorKind::SyscallFailure;
    }

    eof_char_ = static_cast<char>(attrs.c_cc[VEOF]);

    return {};
}

Result<void> Subprocess::init_parent() {
    // Close the ends used by the child
    if (child_stdin_fd_ != -1) {
        TRYE(linux::close(child_stdin_fd_), SyscallFailure);
    }
    if (child_stdout_fd_ != -1 && child_stdout_fd_ != child_stdin_fd_) {
        TRYE(linux::close(child_stdout_fd_), SyscallFailure);
    }
    child_stdin_fd_ = -1;
    child_stdout_fd_ = -1;

    // Make reading and writing non-blocking
    for (int fd : {input_fd_, output_fd_}) {
        int pre_flags = TRYE(linux::fcntl(fd, F_GETFL), SyscallFailure);
        TRYE(linux::fcntl(fd, F_SETFL, pre_flags | O_NONBLOCK), SyscallFailure); // NOLINT
    }

    return {};
}

void Subprocess::close_fds() {
    auto close_fd = [](int& fd, int& alias) {
        if (fd == -1) {
            return;
        }
        if (auto res = linux::close(fd); !res) {
            LOG_DEBUG("Failed to close fd {}: {}", fd, res.error().message());
        }
        if (alias == fd) {
            alias = -1;
        }
        fd = -1;
    };

    close_fd(input_fd_, output_fd_);
    close_fd(output_fd_, input_fd_);
    close_fd(child_stdin_fd_, child_stdout_fd_);
    close_fd(child_stdout_fd_, child_stdin_fd_);
}

Result<std::string> Subprocess::read_stdout_poll_impl(std::chrono::milliseconds timeout) {
    // If the channel is already closed, all we can do is try reading from the buffer
    if (output_fd_ == -1) {
        return read_stdout();
    }

    TRYE(linux::poll(output_fd_, POLLIN, timeout), SyscallFailure);

    return read_stdout();
}

Result<std::string> Subprocess::read_stdout() {
    TRY(read_stdout_impl());

    // Cursor is still at the end of the buffer -> no data was read
    if (stdout_cursor_ == stdout_buffer_.size()) {
        return "";
    }

    auto res = stdout_buffer_.substr(stdout_cursor_);
    stdout_cursor_ = stdout_buffer_.size();

    return res;
}

Result<void> Subprocess::read_stdout_impl() {
    using namespace std::chrono_literals;

    while (output_fd_ != -1) {
        short revents = TRYE(linux::poll(output_fd_, POLLIN, 0ms), SyscallFailure);

        if (revents == 0) {
            return {};
        }

        auto res = linux::read(output_fd_, READ_CHUNK_SIZE);

        if (!res) {
            if (res.error() == std::errc::resource_unavailable_try_again ||
                res.error() == std::errc::interrupted) {
                return {};
            }

            // A pseudo-terminal master reports EIO once every slave descriptor is closed
            if (res.error() != std::errc::io_error) {
                return ErrorKind::SyscallFailure;
            }
        }

        if (!res || res.value().empty()) {
            LOG_TRACE("Output channel of {} reached EOF", child_pid_);
            int fd = std::exchange(output_fd_, -1);
            if (input_fd_ == fd) {
                input_fd_ = -1;
            }
            TRYE(linux::close(fd), SyscallFailure);
            return {};
        }

        stdout_buffer_ += res.value();
    }

    return {};
}

Result<void> Subprocess::send_stdin(std::string_view str, std::chrono::milliseconds timeout) {
    using std::chrono::steady_clock;
    using namespace std::chrono_literals;

    const auto deadline = steady_clock::now() + timeout;

    while (!str.empty()) {
        if (input_fd_ == -1) {
            return ErrorKind::ChannelClosed;
        }

        auto res = linux::write(input_fd_, str);

        if (res) {
            str.remove_prefix(gsl::narrow_cast<std::size_t>(res.value()));
            continue;
        }

        if (res.error() == std::errc::broken_pipe || res.error() == std::errc::io_error) {
            return ErrorKind::ChannelClosed;
        }

        if (res.error() != std::errc::resource_unavailable_try_again && res.error() != std::errc::interrupted) {
            return ErrorKind::SyscallFailure;
        }

        if (steady_clock::now() >= deadline) {
            return ErrorKind::TimedOut;
        }

        // The child is not consuming its input; keep its output flowing so it cannot block on a full channel
        TRY(read_stdout_impl());
        TRYE(linux::poll(input_fd_, POLLOUT, 5ms), SyscallFailure);
    }

    return {};
}

Result<void> Subprocess::send_line(std::string_view line, std::chrono::milliseconds timeout) {
    std::string data;
    data.reserve(line.size() + line.size() / TERMINAL_LINE_CHUNK + 1);

    if (options_.channel == ChannelKind::Terminal) {
        // The canonical line buffer holds 4095 bytes and silently discards the rest of a longer line.
        // An EOF character on a non-empty line hands the pending bytes to the reader without ending input
        while (line.size() > TERMINAL_LINE_CHUNK) {
            data += line.substr(0, TERMINAL_LINE_CHUNK);
            data += eof_char_;
            line.remove_prefix(TERMINAL_LINE_CHUNK);
        }
    }

    data += line;
    data += '\n';

    return send_stdin(data, timeout);
}

Result<void> Subprocess::close_stdin() {
    if (input_fd_ == -1) {
        return ErrorKind::ChannelClosed;
    }

    if (options_.channel == ChannelKind::Terminal) {
        return send_stdin(std::string_view{&eof_char_, 1});
    }

    TRYE(linux::close(input_fd_), SyscallFailure);
    input_fd_ = -1;

    return {};
}

Result<void> Subprocess::terminate() {
    if (!is_alive()) {
        return {};
    }

    LOG_DEBUG("Killing process group {}", child_pid_);

    if (auto res = linux::kill(-child_pid_, SIGKILL); !res) {
        LOG_DEBUG("Process group {} already gone: {}", child_pid_, res.error().message());
    }
    TRYE(linux::kill(child_pid_, SIGKILL), SyscallFailure);

    auto waited = TRYE(linux::wait4(child_pid_), SyscallFailure);
    run_result_ = RunResult::from_wait_status(waited.status, waited.usage);

    // Output written before the kill is still worth keeping
    TRY(read_stdout_impl());

    return {};
}

Result<std::optional<RunResult>> Subprocess::poll_exit() {
    if (run_result_) {
        return run_result_;
    }

    if (child_pid_ == 0) {
        return ErrorKind::NotStarted;
    }

    auto waited = TRYE(linux::wait4(child_pid_, WNOHANG), SyscallFailure);

    if (waited.pid == 0) {
        return std::optional<RunResult>{};
    }

    run_result_ = RunResult::from_wait_status(waited.status, waited.usage);
    LOG_DEBUG("Process {} finished ({} {})", child_pid_, run_result_->get_kind(), run_result_->get_code());

    return run_result_;
}

Result<RunResult> Subprocess::wait_for_exit(std::chrono::milliseconds timeout) {
    using std::chrono::steady_clock;
    using namespace std::chrono_literals;

    const auto deadline = steady_clock::now() + timeout;

    while (true) {
        std::optional<RunResult> exited = TRY(poll_exit());

        if (exited) {
            TRY(read_stdout_impl());
            return *exited;
        }

        if (steady_clock::now() >= deadline) {
            return ErrorKind::TimedOut;
        }

        TRY(read_stdout_impl());

        if (output_fd_ != -1) {
            TRYE(linux::poll(output_fd_, POLLIN, 5ms), SyscallFailure);
        } else {
            std::this_thread::sleep_for(5ms);
        }
    }
}

Result<char> Subprocess::get_state() const {
    if (child_pid_ == 0) {
        return ErrorKind::NotStarted;
    }

    int fd = TRYE(linux::open(fmt::format("/proc/{}/stat", child_pid_), O_RDONLY | O_CLOEXEC), SyscallFailure);
    auto close_fd = gsl::finally([fd] {
        if (auto res = linux::close(fd); !res) {
            LOG_DEBUG("Failed to close /proc stat fd: {}", res.error().message());
        }
    });

    std::string stat = TRYE(linux::read(fd, PROC_STAT_READ_SIZE), SyscallFailure);

    // Format: "pid (comm) state ..."; comm may itself contain parentheses
    auto comm_end = stat.rfind(')');

    if (comm_end == std::string::npos || comm_end + 2 >= stat.size()) {
        return ErrorKind::UnknownError;
    }

    return stat[comm_end + 2];
}

} // namespace iojudge
