#pragma once

#include <iojudge/build/build_manager.hpp>
#include <iojudge/common/class_traits.hpp>
#include <iojudge/common/command.hpp>
#include <iojudge/common/formatters/enum.hpp>
#include <iojudge/execution/execution_result.hpp>
#include <iojudge/subprocess/sandbox.hpp>
#include <iojudge/subprocess/subprocess.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace iojudge {

inline constexpr std::chrono::milliseconds DEFAULT_EXECUTION_TIMEOUT = std::chrono::seconds{5};
inline constexpr std::chrono::milliseconds DEFAULT_IDLE_WINDOW{30};
inline constexpr std::size_t DEFAULT_MEMORY_LIMIT = std::size_t{1} << 30U;
inline constexpr std::size_t DEFAULT_OUTPUT_LIMIT = std::size_t{1} << 20U;

enum class ExecutionMode {
    /// Inputs are fed one at a time, whenever the program waits for input
    Interactive,
    /// Every input is written up front; the transcript is [Input..., Output(all output)]
    Stream,
};

struct ExecutionConfig
{
    /// Wall-clock bound of the whole execution
    std::chrono::milliseconds timeout = DEFAULT_EXECUTION_TIMEOUT;

    /// A zero cpu_time is derived from ``timeout``
    IsolationLimits limits{.memory_bytes = DEFAULT_MEMORY_LIMIT, .output_bytes = DEFAULT_OUTPUT_LIMIT};

    /// How long the program must stay silent before it may be considered to be waiting for input
    std::chrono::milliseconds idle_window = DEFAULT_IDLE_WINDOW;

    ExecutionMode mode = ExecutionMode::Interactive;

    /// null: a ``LocalSandbox``
    std::shared_ptr<Sandbox> sandbox{};
};

/// Runs a ``BuildArtifact`` against input sequences, recording what happened
class ExecutionManager : NonCopyable
{
public:
    ExecutionManager(BuildArtifact artifact, ExecutionConfig config);
    virtual ~ExecutionManager() = default;
    ExecutionManager(ExecutionManager&&) = default;
    ExecutionManager& operator=(ExecutionManager&&) = default;

    /// Launches a fresh process and drives it with ``inputs``.
    /// Untrusted-program failures are reported in the result; throws SandboxError
    /// only if the process could not be launched or supervised.
    virtual ExecutionResult execute(const std::vector<std::string>& inputs, std::stop_token stop = {});

    const BuildArtifact& get_artifact() const { return artifact_; }

    const ExecutionConfig& get_config() const { return config_; }

protected:
    /// Command line that launches the artifact
    virtual Command get_command() const = 0;

private:
    BuildArtifact artifact_;
    ExecutionConfig config_;
};

class CompiledLanguageExecutionManager : public ExecutionManager
{
public:
    using ExecutionManager::ExecutionManager;

protected:
    Command get_command() const override;
};

class InterpretedLanguageExecutionManager : public ExecutionManager
{
public:
    /// ``interpreter_command`` is a template where {source} is the artifact's entry point
    InterpretedLanguageExecutionManager(BuildArtifact artifact, ExecutionConfig config, Command interpreter_command);

protected:
    Command get_command() const override;

private:
    Command interpreter_command_;
};

} // namespace iojudge

FMT_SERIALIZE_ENUM(::iojudge::ExecutionMode, Interactive, Stream);
