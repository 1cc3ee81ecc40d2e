#pragma once

#include <iojudge/common/command.hpp>
#include <iojudge/common/error_types.hpp>
#include <iojudge/subprocess/subprocess.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace iojudge {

/// Isolation boundary around a single program execution.
///
/// Implementations must not share state between the processes they launch.
class Sandbox
{
public:
    virtual ~Sandbox() = default;

    /// Launches ``command`` inside ``workdir`` under ``limits``. The returned process has been started.
    virtual Result<std::unique_ptr<Subprocess>> run_isolated(const Command& command,
                                                             const std::filesystem::path& workdir,
                                                             const IsolationLimits& limits,
                                                             ChannelKind channel = ChannelKind::Terminal) = 0;
};

/// Runs programs as direct children, constrained by resource limits (setrlimit) and a minimal environment
class LocalSandbox : public Sandbox
{
public:
    Result<std::unique_ptr<Subprocess>> run_isolated(const Command& command, const std::filesystem::path& workdir,
                                                     const IsolationLimits& limits,
                                                     ChannelKind channel = ChannelKind::Terminal) override;

    /// PATH, LANG (defaulting to C) and LD_LIBRARY_PATH of the current process
    static std::vector<std::string> minimal_environment();
};

} // namespace iojudge
