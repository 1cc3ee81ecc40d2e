#pragma once

#include <iojudge/common/expected.hpp>
#include <iojudge/execution/execution_manager.hpp>
#include <iojudge/judge.hpp>

#include "output/verbosity.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace iojudge {

struct ProgramOptions
{
    // ###### Argument fields

    enum class Subcommand { Run, Grade } subcommand = Subcommand::Grade;

    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    std::filesystem::path source_path;

    /// `run`: the input sets file. `grade`: the interaction spec file
    std::filesystem::path data_path;

    /// Key, alias or extension. Inferred from the extension of `source_path` if absent
    std::optional<std::string> language;

    std::chrono::milliseconds timeout = DEFAULT_EXECUTION_TIMEOUT;
    std::size_t memory_limit_mib = DEFAULT_MEMORY_LIMIT >> 20U;

    /// 0 = one per hardware thread
    std::size_t jobs = 1;

    bool stream_mode = false;

    /// Abort with the compiler output instead of reporting a build error per test case
    bool raises = false;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    // ###### Argument defaults

    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path, std::string_view what) {
        if (!std::filesystem::exists(path)) {
            return fmt::format("{} {:?} does not exist", what, path.string());
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              std::string_view what) {
        TRY(ensure_file_exists(path, what));

        if (!std::filesystem::is_regular_file(path)) {
            return fmt::format("{} {:?} is not a regular file", what, path.string());
        }

        return {};
    }

    /// Verify that all fields are valid. Clamps the verbosity to [MIN, MAX]
    Expected<void, std::string> validate();

    /// `language` if specified, otherwise the extension of `source_path`
    std::string get_language_identifier() const;

    JudgeOptions to_judge_options() const;
};

} // namespace iojudge

FMT_SERIALIZE_ENUM(::iojudge::ProgramOptions::Subcommand, Run, Grade);
FMT_SERIALIZE_ENUM(::iojudge::ProgramOptions::ColorizeOpt, Auto, Always, Never);
FMT_SERIALIZE_ENUM(::iojudge::VerbosityLevel, Silent, Quiet, Summary, All, Extra, Max);

template <>
struct fmt::formatter<::iojudge::ProgramOptions> : fmt::formatter<std::string>
{
    auto format(const ::iojudge::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(
            fmt::format("{{subcommand={}, verbosity={}, source={:?}, data={:?}, lang={:?}, timeout={}ms, "
                        "memory={}MiB, jobs={}, stream={}, raises={}, color={}}}",
                        from.subcommand, from.verbosity, from.source_path.string(), from.data_path.string(),
                        from.language.value_or("<inferred>"), from.timeout.count(), from.memory_limit_mib,
                        from.jobs, from.stream_mode, from.raises, from.colorize_option),
            ctx);
    }
};
