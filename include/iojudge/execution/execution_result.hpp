#pragma once

#include <iojudge/common/formatters/enum.hpp>
#include <iojudge/interaction/interaction.hpp>
#include <iojudge/subprocess/run_result.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace iojudge {

enum class TerminationReason {
    Completed, ///< Exited normally with status 0
    TimedOut,  ///< Wall-clock (or CPU) limit exceeded; the process was killed
    Crashed,   ///< Nonzero exit status, or terminated by a signal it raised/received on its own
    Killed,    ///< Terminated by the judge: cancellation or output limit
};

/// Observed outcome of one execution. Produced once, never mutated afterwards
struct ExecutionResult
{
    Transcript transcript;

    /// Set if the process exited normally
    std::optional<int> exit_code;

    /// Set if the process was terminated by a signal
    std::optional<int> signal;

    std::chrono::milliseconds elapsed{};
    ResourceUsage usage{};
    TerminationReason reason = TerminationReason::Completed;

    /// Inputs the process ended without consuming
    std::vector<std::string> unused_inputs;

    /// Human-readable detail on the termination, empty on normal completion
    std::string message;
};

} // namespace iojudge

FMT_SERIALIZE_ENUM(::iojudge::TerminationReason, Completed, TimedOut, Crashed, Killed);
