#include "execution/interaction_session.hpp"

#include "execution/transcript_recorder.hpp"

#include <iojudge/common/error_types.hpp>
#include <iojudge/common/linux.hpp>
#include <iojudge/exceptions.hpp>
#include <iojudge/logging.hpp>
#include <iojudge/subprocess/sandbox.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <libassert/assert.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace iojudge {

namespace {

using namespace std::chrono_literals;

constexpr std::chrono::milliseconds STREAM_POLL_INTERVAL = 50ms;

constexpr std::string_view EARLY_EXIT_MESSAGE = "Process closed without consuming all inputs";

} // namespace

InteractionSession::InteractionSession(Command command, std::filesystem::path workdir, const ExecutionConfig& config,
                                       std::vector<std::string> inputs, std::stop_token stop)
    : command_{std::move(command)}
    , workdir_{std::move(workdir)}
    , config_{config}
    , inputs_{std::move(inputs)}
    , stop_{std::move(stop)} {}

ExecutionResult InteractionSession::run() {
    ASSERT(proc_ == nullptr, "InteractionSession::run may only be called once");

    launch();

    if (config_.mode == ExecutionMode::Stream) {
        stream();
    } else {
        interact();
    }

    collect();

    return normalize();
}

void InteractionSession::launch() {
    ASSERT(!command_.empty());

    IsolationLimits limits = config_.limits;
    limits.wall_time = config_.timeout;
    if (limits.cpu_time == 0ms) {
        limits.cpu_time = config_.timeout;
    }

    std::shared_ptr<Sandbox> sandbox = config_.sandbox ? config_.sandbox : std::make_shared<LocalSandbox>();
    ChannelKind channel = config_.mode == ExecutionMode::Stream ? ChannelKind::Pipe : ChannelKind::Terminal;

    start_time_ = Clock::now();
    deadline_ = start_time_ + config_.timeout;
    last_activity_ = start_time_;

    auto res = sandbox->run_isolated(command_, workdir_, limits, channel);

    if (!res) {
        throw SandboxError{res.error(), fmt::format("could not launch {:?}", command_.front())};
    }

    proc_ = std::move(res).value();

    LOG_DEBUG("Launched pid {} ({} mode): {}", proc_->get_pid(), config_.mode, fmt::join(command_, " "));
}

void InteractionSession::interact() {
    while (!check_bounds()) {
        const auto wait = std::min(config_.idle_window, remaining());

        if (proc_->is_stdout_closed()) {
            // Nothing more can be read; all that is left is to wait for the process to exit
            auto exit_res = proc_->wait_for_exit(wait);

            if (exit_res) {
                break;
            }
            if (exit_res.error() != ErrorKind::TimedOut) {
                throw SandboxError{exit_res.error(), "failed to wait for program"};
            }
            continue;
        }

        if (pump_output(wait)) {
            continue;
        }

        auto exited = proc_->poll_exit();

        if (!exited) {
            throw SandboxError{exited.error(), "failed to wait for program"};
        }

        if (exited.value()) {
            LOG_DEBUG("pid {} exited after consuming {}/{} inputs", proc_->get_pid(), input_cursor_, inputs_.size());
            break;
        }

        if (Clock::now() - last_activity_ >= config_.idle_window && is_awaiting_input()) {
            if (input_cursor_ < inputs_.size()) {
                send_next_input();
            } else {
                send_eof();
            }
        }
    }
}

void InteractionSession::stream() {
    std::string data;
    for (const std::string& value : inputs_) {
        data += value;
        data += '\n';
    }

    if (auto res = proc_->send_stdin(data, remaining()); !res) {
        if (res.error() != ErrorKind::ChannelClosed && res.error() != ErrorKind::TimedOut) {
            throw SandboxError{res.error(), "failed to write program input"};
        }
        LOG_DEBUG("pid {} did not consume all of its input: {}", proc_->get_pid(), res.error());
    }

    if (auto res = proc_->close_stdin(); !res && res.error() != ErrorKind::ChannelClosed) {
        throw SandboxError{res.error(), "failed to close program input"};
    }

    while (!check_bounds()) {
        auto exit_res = proc_->wait_for_exit(std::min(STREAM_POLL_INTERVAL, remaining()));

        if (exit_res) {
            break;
        }
        if (exit_res.error() != ErrorKind::TimedOut) {
            throw SandboxError{exit_res.error(), "failed to wait for program"};
        }
    }
}

void InteractionSession::collect() {
    if (proc_->is_alive()) {
        // Only reachable if the process exited between the last bound check and now
        auto exit_res = proc_->wait_for_exit(remaining());

        if (!exit_res) {
            abort_with(TerminationReason::TimedOut, fmt::format("time limit exceeded ({})", config_.timeout));
        }
    }

    auto rest = proc_->read_stdout();

    if (!rest) {
        throw SandboxError{rest.error(), "failed to read program output"};
    }

    recorder_.record_output(rest.value());
}

ExecutionResult InteractionSession::normalize() {
    const auto& run_result = proc_->get_run_result();
    ASSERT(run_result.has_value(), "process must have been reaped before normalizing");

    ExecutionResult result;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_time_);
    result.usage = run_result->get_usage();

    if (run_result->get_kind() == RunResult::Kind::Exited) {
        result.exit_code = run_result->get_code();
    } else {
        result.signal = run_result->get_code();
    }

    if (forced_reason_) {
        result.reason = *forced_reason_;
        result.message = message_;
    } else if (result.signal == SIGXCPU) {
        result.reason = TerminationReason::TimedOut;
        result.message = "CPU time limit exceeded";
    } else if (result.signal) {
        result.reason = TerminationReason::Crashed;
        result.message = fmt::format("terminated by signal {} ({})", *result.signal,
                                     linux::Signal{*result.signal}.to_string());
    } else if (result.exit_code != 0) {
        result.reason = TerminationReason::Crashed;
        result.message = fmt::format("exited with status {}", *result.exit_code);
    }

    if (config_.mode == ExecutionMode::Stream) {
        for (const std::string& value : inputs_) {
            result.transcript.push_back(Interaction::input(value));
        }
        Transcript output = recorder_.finish();
        result.transcript.insert(result.transcript.end(), output.begin(), output.end());
    } else {
        result.transcript = recorder_.finish();
        result.unused_inputs.assign(inputs_.begin() + static_cast<std::ptrdiff_t>(input_cursor_), inputs_.end());
    }

    if (!result.unused_inputs.empty() && result.reason != TerminationReason::TimedOut &&
        result.reason != TerminationReason::Killed) {
        std::string detail = fmt::format("{}. Unused inputs: {}", EARLY_EXIT_MESSAGE, result.unused_inputs);
        result.message = result.message.empty() ? detail : fmt::format("{}; {}", result.message, detail);
    }

    LOG_DEBUG("Execution of {} finished: {} after {} ({})", command_.front(), result.reason, result.elapsed,
              result.message);

    return result;
}

bool InteractionSession::pump_output(std::chrono::milliseconds timeout) {
    auto chunk = proc_->read_stdout(timeout);

    if (!chunk) {
        throw SandboxError{chunk.error(), "failed to read program output"};
    }

    if (chunk.value().empty()) {
        return false;
    }

    LOG_TRACE("pid {} wrote {:?}", proc_->get_pid(), chunk.value());

    recorder_.record_output(chunk.value());
    last_activity_ = Clock::now();

    return true;
}

bool InteractionSession::is_awaiting_input() const {
    auto state = proc_->get_state();

    // The process may have exited in the meantime; the next iteration will notice
    if (!state) {
        return false;
    }

    // 'S': interruptible sleep, which is where a blocking read on the terminal waits
    return state.value() == 'S';
}

void InteractionSession::send_next_input() {
    const std::string& value = inputs_[input_cursor_];

    auto res = proc_->send_line(value, remaining());

    if (!res) {
        if (res.error() == ErrorKind::ChannelClosed || res.error() == ErrorKind::TimedOut) {
            LOG_DEBUG("Could not deliver input #{} to pid {}: {}", input_cursor_, proc_->get_pid(), res.error());
            return;
        }
        throw SandboxError{res.error(), "failed to write program input"};
    }

    LOG_DEBUG("Sent input #{} {:?} to pid {}", input_cursor_, value, proc_->get_pid());

    recorder_.record_input(value);
    ++input_cursor_;
    last_activity_ = Clock::now();
}

void InteractionSession::send_eof() {
    if (auto res = proc_->close_stdin(); !res && res.error() != ErrorKind::ChannelClosed) {
        throw SandboxError{res.error(), "failed to signal end of input"};
    }

    LOG_DEBUG("Inputs exhausted; sent EOF to pid {}", proc_->get_pid());

    last_activity_ = Clock::now();
}

void InteractionSession::abort_with(TerminationReason reason, std::string message) {
    LOG_DEBUG("Aborting pid {}: {} ({})", proc_->get_pid(), reason, message);

    forced_reason_ = reason;
    message_ = std::move(message);

    if (auto res = proc_->terminate(); !res) {
        throw SandboxError{res.error(), "failed to kill program"};
    }
}

bool InteractionSession::check_bounds() {
    if (stop_.stop_requested()) {
        abort_with(TerminationReason::Killed, "execution cancelled");
        return true;
    }

    if (Clock::now() >= deadline_) {
        abort_with(TerminationReason::TimedOut, fmt::format("time limit exceeded ({})", config_.timeout));
        return true;
    }

    const std::size_t output_limit = config_.limits.output_bytes;
    if (output_limit != 0 && proc_->get_full_stdout().size() > output_limit) {
        abort_with(TerminationReason::Killed, "output limit exceeded");
        return true;
    }

    return false;
}

std::chrono::milliseconds InteractionSession::remaining() const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now());

    return std::max(left, 0ms);
}

} // namespace iojudge
