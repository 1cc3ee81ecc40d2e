#include <iojudge/subprocess/sandbox.hpp>

#include <iojudge/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

namespace iojudge {

std::vector<std::string> LocalSandbox::minimal_environment() {
    std::vector<std::string> env;

    auto forward = [&env](const char* name, const char* fallback) {
        const char* value = std::getenv(name);

        if (value == nullptr) {
            value = fallback;
        }

        if (value != nullptr) {
            env.push_back(fmt::format("{}={}", name, value));
        }
    };

    forward("PATH", "/usr/local/bin:/usr/bin:/bin");
    forward("LANG", "C");
    forward("LD_LIBRARY_PATH", nullptr);

    return env;
}

Result<std::unique_ptr<Subprocess>> LocalSandbox::run_isolated(const Command& command,
                                                               const std::filesystem::path& workdir,
                                                               const IsolationLimits& limits, ChannelKind channel) {
    ASSERT(!command.empty());

    SubprocessOptions options{
        .workdir = workdir,
        .env = minimal_environment(),
        .limits = limits,
        .channel = channel,
        .merge_stderr = true,
    };

    auto proc = std::make_unique<Subprocess>(command.front(), Command(command.begin() + 1, command.end()),
                                             std::move(options));

    if (auto res = proc->start(); !res) {
        LOG_DEBUG("Sandbox failed to launch {:?}: {}", command.front(), res.error());
        return res.error();
    }

    return proc;
}

} // namespace iojudge
