#pragma once

#include <iojudge/common/formatters/enum.hpp>

#include <chrono>
#include <cstdint>

#include <sys/resource.h>

namespace iojudge {

/// Resource usage of a finished process, as reported by wait4(2)
struct ResourceUsage
{
    std::chrono::microseconds user_time{};
    std::chrono::microseconds system_time{};
    std::int64_t max_rss_kb{};

    static ResourceUsage from_rusage(const rusage& usage);

    bool operator==(const ResourceUsage&) const = default;
};

class RunResult
{
public:
    enum class Kind { Exited, Signaled };

    static RunResult make_exited(int code, ResourceUsage usage = {});
    static RunResult make_signaled(int signal, ResourceUsage usage = {});

    /// Decodes a wait(2) status of a terminated process
    static RunResult from_wait_status(int status, const rusage& usage);

    Kind get_kind() const;

    /// The exit code if Exited, otherwise the terminating signal number
    int get_code() const;

    const ResourceUsage& get_usage() const;

private:
    RunResult(Kind kind, int code, ResourceUsage usage);

    Kind kind_;
    int code_;
    ResourceUsage usage_;
};

} // namespace iojudge

FMT_SERIALIZE_ENUM(::iojudge::RunResult::Kind, Exited, Signaled);
