#pragma once

#include <iojudge/common/class_traits.hpp>
#include <iojudge/common/error_types.hpp>
#include <iojudge/common/linux.hpp>
#include <iojudge/subprocess/run_result.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

namespace iojudge {

/// Limits applied to a single child process. A zero value disables the limit
struct IsolationLimits
{
    /// RLIMIT_CPU, rounded up to whole seconds
    std::chrono::milliseconds cpu_time{0};

    /// RLIMIT_AS
    std::size_t memory_bytes{0};

    /// Enforced by whoever supervises the process, not by the kernel
    std::chrono::milliseconds wall_time{0};

    /// Maximum captured output; enforced by the supervisor
    std::size_t output_bytes{0};

    /// RLIMIT_FSIZE
    std::size_t file_size_bytes{0};
};

/// How the child's standard streams are connected to the parent
enum class ChannelKind {
    Pipe,     ///< stdin and stdout (+stderr) are pipes
    Terminal, ///< stdin, stdout and stderr are the slave side of a pseudo-terminal
};

struct SubprocessOptions
{
    /// Working directory of the child. Empty: inherit
    std::filesystem::path workdir{};

    /// Environment of the child, as "KEY=VALUE" entries
    std::vector<std::string> env{};

    IsolationLimits limits{};

    ChannelKind channel = ChannelKind::Pipe;

    /// Pipe channel only: redirect stderr into the stdout pipe (otherwise /dev/null)
    bool merge_stderr = true;
};

/// A child process with a bidirectional byte channel.
///
/// The child is placed in its own session, so ``terminate`` reaches every process it spawned.
class Subprocess : NonCopyable
{
public:
    /// Creates (but does not start) a child process running ``exec`` with ``args``.
    /// ``exec`` is looked up in PATH if it does not contain a '/'.
    explicit Subprocess(std::string exec, std::vector<std::string> args, SubprocessOptions options = {});
    ~Subprocess();
    Subprocess(Subprocess&&) noexcept;
    Subprocess& operator=(Subprocess&&) noexcept;

    /// Forks and execs the child. Fails with ExecFailure if the program could not be executed
    Result<void> start();

    /// Waits up to ``timeout`` for output, then returns whatever is available (possibly nothing)
    template <typename Rep, typename Period>
    Result<std::string> read_stdout(const std::chrono::duration<Rep, Period>& timeout) {
        return read_stdout_poll_impl(std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
    }

    /// Non-blocking; returns output not yet returned by a previous read
    Result<std::string> read_stdout();

    /// Get all output since the program was launched
    const std::string& get_full_stdout() const { return stdout_buffer_; }

    /// Whether the output channel reached end-of-file (every writer closed it)
    bool is_stdout_closed() const { return output_fd_ == -1; }

    /// Writes all of ``str``, failing with TimedOut if the child does not consume it in time
    Result<void> send_stdin(std::string_view str, std::chrono::milliseconds timeout = std::chrono::seconds{1});

    /// Writes ``line`` followed by a newline. On a terminal, lines longer than the line discipline's
    /// buffer are pushed to the reader in pieces (each terminated by the EOF character) so none of it is dropped
    Result<void> send_line(std::string_view line, std::chrono::milliseconds timeout = std::chrono::seconds{1});

    /// Signals end-of-input. Pipe: closes the write end. Terminal: sends the EOF character,
    /// which may be done repeatedly.
    Result<void> close_stdin();

    /// Kills the child's whole process group with SIGKILL and reaps it
    Result<void> terminate();

    /// Non-blocking check for exit. Reaps the child if it has exited
    Result<std::optional<RunResult>> poll_exit();

    /// Blocks until exit or timeout, draining output meanwhile
    Result<RunResult> wait_for_exit(std::chrono::milliseconds timeout);

    /// Whether child process is alive (started and not yet reaped)
    bool is_alive() const { return child_pid_ != 0 && !run_result_; }

    /// Scheduler state from /proc/<pid>/stat (e.g. 'R', 'S', 'Z')
    Result<char> get_state() const;

    pid_t get_pid() const { return child_pid_; }

    const std::optional<RunResult>& get_run_result() const { return run_result_; }

    ChannelKind get_channel_kind() const { return options_.channel; }

private:
    Result<void> create_pipes();
    Result<void> create_terminal();

    /// Only async-signal-safe calls; never returns
    [[noreturn]] void exec_child(const char* exec, char* const* argv, char* const* envp, int error_fd);

    Result<void> init_parent();

    Result<std::string> read_stdout_poll_impl(std::chrono::milliseconds timeout);

    /// Reads any data on the output channel to stdout_buffer_
    Result<void> read_stdout_impl();

    void close_fds();

    std::string exec_;
    std::vector<std::string> args_;
    SubprocessOptions options_;

    pid_t child_pid_{};
    std::optional<RunResult> run_result_;

    /// Parent-side descriptors. For a terminal, input_fd_ and output_fd_ are the same master fd
    int input_fd_{-1};
    int output_fd_{-1};

    /// Child-side descriptors, closed by the parent once the child is running
    int child_stdin_fd_{-1};
    int child_stdout_fd_{-1};

    char eof_char_{'\x04'};

    std::string stdout_buffer_;
    std::size_t stdout_cursor_{};
};

} // namespace iojudge

FMT_SERIALIZE_ENUM(::iojudge::ChannelKind, Pipe, Terminal);
