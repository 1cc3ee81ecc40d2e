#include "user/program_options.hpp"

#include <iojudge/common/expected.hpp>
#include <iojudge/execution/execution_manager.hpp>
#include <iojudge/judge.hpp>
#include <iojudge/registrars/language_registry.hpp>

#include "output/verbosity.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <chrono>
#include <string>

namespace iojudge {

Expected<void, std::string> ProgramOptions::validate() {
    constexpr auto MAX_VERBOSITY = VerbosityLevel::Max;
    constexpr auto MIN_VERBOSITY = VerbosityLevel{};

    verbosity = std::clamp(verbosity, MIN_VERBOSITY, MAX_VERBOSITY);

    TRY(ensure_is_regular_file(source_path, "Source file"));
    TRY(ensure_is_regular_file(data_path, subcommand == Subcommand::Run ? "Inputs file" : "Interaction spec file"));

    if (timeout <= std::chrono::milliseconds::zero()) {
        return std::string{"Timeout must be positive"};
    }

    const std::string identifier = get_language_identifier();

    if (!LanguageRegistry::get().contains(identifier)) {
        return fmt::format("Unknown language {:?} (specify one with --lang). One of: {}", identifier,
                           fmt::join(LanguageRegistry::get().get_language_keys(), ", "));
    }

    return {};
}

std::string ProgramOptions::get_language_identifier() const {
    if (language) {
        return *language;
    }

    return source_path.extension().string();
}

JudgeOptions ProgramOptions::to_judge_options() const {
    JudgeOptions opts;

    opts.execution.timeout = timeout;
    opts.execution.limits.memory_bytes = memory_limit_mib << 20U;
    opts.execution.mode = stream_mode ? ExecutionMode::Stream : ExecutionMode::Interactive;
    opts.jobs = jobs;
    opts.raises = raises;

    return opts;
}

} // namespace iojudge
