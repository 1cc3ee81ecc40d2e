#include <iojudge/build/build_manager.hpp>

#include <iojudge/build/temp_workspace.hpp>
#include <iojudge/common/command.hpp>
#include <iojudge/exceptions.hpp>
#include <iojudge/logging.hpp>
#include <iojudge/subprocess/sandbox.hpp>
#include <iojudge/subprocess/subprocess.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <libassert/assert.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace iojudge {

namespace {

constexpr std::string_view SOURCE_STEM = "main";

} // namespace

BuildManager::BuildManager(std::string source, std::string language)
    : source_{std::move(source)}
    , language_{std::move(language)} {}

std::optional<std::filesystem::path> BuildManager::get_workspace_path() const {
    if (!workspace_) {
        return std::nullopt;
    }

    return workspace_->path();
}

TempWorkspace& BuildManager::workspace() {
    if (!workspace_) {
        workspace_.emplace(fmt::format("iojudge-{}", language_));
    }

    return *workspace_;
}

std::filesystem::path BuildManager::write_source(std::string_view extension) {
    if (!source_path_) {
        source_path_ = workspace().write_file(fmt::format("{}.{}", SOURCE_STEM, extension), source_);
    }

    return *source_path_;
}

BuildManager::ToolResult BuildManager::run_tool(const Command& command, std::chrono::milliseconds timeout) {
    ASSERT(!command.empty());
    LOG_DEBUG("Running build tool: {}", fmt::join(command, " "));

    Subprocess proc{command.front(), Command(command.begin() + 1, command.end()),
                    SubprocessOptions{
                        .workdir = workspace().path(),
                        .env = LocalSandbox::minimal_environment(),
                        .limits = {},
                        .channel = ChannelKind::Pipe,
                        .merge_stderr = true,
                    }};

    if (auto res = proc.start(); !res) {
        throw BuildError{fmt::format("could not run {} ({})", command.front(), res.error()),
                         fmt::format("{} is unavailable", command.front())};
    }

    // Build tools get no input
    if (auto res = proc.close_stdin(); !res) {
        LOG_DEBUG("Failed to close stdin of build tool: {}", res.error());
    }

    auto exit_res = proc.wait_for_exit(timeout);

    if (!exit_res) {
        if (exit_res.error() != ErrorKind::TimedOut) {
            throw SandboxError{exit_res.error(), fmt::format("failed to supervise {}", command.front())};
        }

        LOG_DEBUG("{} timed out after {}", command.front(), timeout);

        if (auto res = proc.terminate(); !res) {
            throw SandboxError{res.error(), fmt::format("failed to kill {}", command.front())};
        }

        return {.success = false, .timed_out = true, .output = proc.get_full_stdout()};
    }

    const RunResult& result = exit_res.value();
    bool success = result.get_kind() == RunResult::Kind::Exited && result.get_code() == 0;

    LOG_DEBUG("{} finished: {} {}", command.front(), result.get_kind(), result.get_code());

    return {.success = success, .timed_out = false, .output = proc.get_full_stdout()};
}

CompiledLanguageBuildManager::CompiledLanguageBuildManager(std::string source, std::string language,
                                                           CompiledLanguageConfig config)
    : BuildManager{std::move(source), std::move(language)}
    , config_{std::move(config)} {}

CommandPaths CompiledLanguageBuildManager::get_paths() {
    std::filesystem::path source_path = write_source(config_.source_extension);

    return {.source = source_path.string(),
            .executable = (workspace().path() / config_.executable_name).string(),
            .workspace = workspace().path().string()};
}

void CompiledLanguageBuildManager::check_syntax() {
    if (is_syntax_ok()) {
        return;
    }

    if (config_.syntax_check_command.empty()) {
        try {
            build();
        } catch (const SyntaxError&) {
            throw;
        } catch (const BuildError& err) {
            throw SyntaxError{err.get_output()};
        }
        return;
    }

    ToolResult res = run_tool(expand_command(config_.syntax_check_command, get_paths()), config_.build_timeout);

    if (res.timed_out) {
        throw BuildError{res.output, "syntax check is taking too long"};
    }

    if (!res.success) {
        throw SyntaxError{res.output};
    }

    set_syntax_ok();
}

BuildArtifact CompiledLanguageBuildManager::build() {
    CommandPaths paths = get_paths();
    ToolResult res = run_tool(expand_command(config_.build_command, paths), config_.build_timeout);

    if (res.timed_out) {
        throw BuildError{res.output, "compilation is taking too long"};
    }

    if (!res.success) {
        throw BuildError{res.output};
    }

    if (!std::filesystem::exists(paths.executable)) {
        throw BuildError{res.output, "compiler produced no executable"};
    }

    // A successful compilation is a successful syntax check
    set_syntax_ok();

    LOG_DEBUG("Built {} program: {}", get_language(), paths.executable);

    return {.language = get_language(),
            .workspace = workspace().path(),
            .source_path = paths.source,
            .entry_point = paths.executable,
            .syntax_ok = is_syntax_ok()};
}

InterpretedLanguageBuildManager::InterpretedLanguageBuildManager(std::string source, std::string language,
                                                                 InterpretedLanguageConfig config)
    : BuildManager{std::move(source), std::move(language)}
    , config_{std::move(config)} {}

void InterpretedLanguageBuildManager::check_syntax() {
    if (is_syntax_ok()) {
        return;
    }

    std::filesystem::path source_path = write_source(config_.source_extension);

    if (!config_.syntax_check_command.empty()) {
        CommandPaths paths{.source = source_path.string(), .executable = {}, .workspace = workspace().path().string()};
        ToolResult res = run_tool(expand_command(config_.syntax_check_command, paths), config_.build_timeout);

        if (res.timed_out) {
            throw BuildError{res.output, "syntax check is taking too long"};
        }

        if (!res.success) {
            throw SyntaxError{res.output};
        }
    }

    set_syntax_ok();
}

BuildArtifact InterpretedLanguageBuildManager::build() {
    std::filesystem::path source_path = write_source(config_.source_extension);

    return {.language = get_language(),
            .workspace = workspace().path(),
            .source_path = source_path,
            .entry_point = source_path,
            .syntax_ok = is_syntax_ok()};
}

} // namespace iojudge
