#include <iojudge/subprocess/run_result.hpp>

#include <chrono>

#include <sys/resource.h>
#include <sys/wait.h>

namespace iojudge {

namespace {

std::chrono::microseconds to_duration(const timeval& time) {
    return std::chrono::seconds{time.tv_sec} + std::chrono::microseconds{time.tv_usec};
}

} // namespace

ResourceUsage ResourceUsage::from_rusage(const rusage& usage) {
    return {.user_time = to_duration(usage.ru_utime),
            .system_time = to_duration(usage.ru_stime),
            .max_rss_kb = usage.ru_maxrss};
}

RunResult::RunResult(Kind kind, int code, ResourceUsage usage)
    : kind_{kind}
    , code_{code}
    , usage_{usage} {}

RunResult RunResult::make_exited(int code, ResourceUsage usage) {
    return {Kind::Exited, code, usage};
}

RunResult RunResult::make_signaled(int signal, ResourceUsage usage) {
    return {Kind::Signaled, signal, usage};
}

RunResult RunResult::from_wait_status(int status, const rusage& usage) {
    if (WIFSIGNALED(status)) {
        return make_signaled(WTERMSIG(status), ResourceUsage::from_rusage(usage));
    }

    return make_exited(WEXITSTATUS(status), ResourceUsage::from_rusage(usage));
}

RunResult::Kind RunResult::get_kind() const {
    return kind_;
}

int RunResult::get_code() const {
    return code_;
}

const ResourceUsage& RunResult::get_usage() const {
    return usage_;
}

} // namespace iojudge
