#pragma once

#include "execution/transcript_recorder.hpp"

#include <iojudge/common/class_traits.hpp>
#include <iojudge/common/command.hpp>
#include <iojudge/execution/execution_manager.hpp>
#include <iojudge/execution/execution_result.hpp>
#include <iojudge/subprocess/subprocess.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace iojudge {

/// Drives a single execution of a program through its lifecycle:
///
///   Launch -> Interact -> Collect -> Normalize
///
/// with the Interact phase bounded by the configured wall-clock timeout (and by cancellation
/// through the stop token). The process is always terminated and reaped before ``run`` returns.
class InteractionSession : NonMovable
{
public:
    InteractionSession(Command command, std::filesystem::path workdir, const ExecutionConfig& config,
                       std::vector<std::string> inputs, std::stop_token stop);

    /// May only be called once. Throws SandboxError if the process cannot be launched or supervised
    ExecutionResult run();

private:
    using Clock = std::chrono::steady_clock;

    void launch();
    void interact();
    void stream();
    void collect();
    ExecutionResult normalize();

    /// Waits up to ``timeout`` for output and records it. Returns whether any output arrived
    bool pump_output(std::chrono::milliseconds timeout);

    /// Heuristic: silent for the idle window and sleeping in the kernel
    bool is_awaiting_input() const;

    void send_next_input();
    void send_eof();

    /// Kills the process, recording why
    void abort_with(TerminationReason reason, std::string message);

    /// Stops the Interact phase if a bound was hit. Returns whether it did
    bool check_bounds();

    std::chrono::milliseconds remaining() const;

    Command command_;
    std::filesystem::path workdir_;
    const ExecutionConfig& config_;
    std::vector<std::string> inputs_;
    std::stop_token stop_;

    std::unique_ptr<Subprocess> proc_;
    TranscriptRecorder recorder_;

    std::size_t input_cursor_{};
    std::optional<TerminationReason> forced_reason_;
    std::string message_;

    Clock::time_point start_time_;
    Clock::time_point deadline_;
    Clock::time_point last_activity_;
};

} // namespace iojudge
