#pragma once

#include <iojudge/build/temp_workspace.hpp>
#include <iojudge/common/class_traits.hpp>
#include <iojudge/common/command.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace iojudge {

inline constexpr std::chrono::milliseconds DEFAULT_BUILD_TIMEOUT = std::chrono::seconds{10};

/// Description of a runnable program. The workspace it points into is owned by the
/// BuildManager that produced it, and is valid only while that manager is alive.
struct BuildArtifact
{
    std::string language;
    std::filesystem::path workspace;
    std::filesystem::path source_path;

    /// Compiled: the executable. Interpreted: the source file
    std::filesystem::path entry_point;

    bool syntax_ok = false;
};

/// Configuration for languages compiled ahead of execution
///
/// Command templates may use the placeholders {source}, {executable} and {workspace}.
struct CompiledLanguageConfig
{
    /// Without the leading dot
    std::string source_extension;

    Command build_command;

    /// Must not produce anything that is executed
    Command syntax_check_command{};

    std::string executable_name = "main.exe";

    std::chrono::milliseconds build_timeout = DEFAULT_BUILD_TIMEOUT;
};

/// Configuration for languages whose source is run directly by an interpreter
struct InterpretedLanguageConfig
{
    /// Without the leading dot
    std::string source_extension;

    /// e.g. {"python3", "{source}"}
    Command interpreter_command;

    /// Empty: no static check is available
    Command syntax_check_command{};

    std::chrono::milliseconds build_timeout = DEFAULT_BUILD_TIMEOUT;
};

/// Turns source text into a runnable ``BuildArtifact``
///
/// The source is written as "main.<ext>" into a temporary workspace created on first use,
/// which is deleted when the manager is destroyed, on every exit path.
class BuildManager : NonCopyable
{
public:
    BuildManager(std::string source, std::string language);
    virtual ~BuildManager() = default;
    BuildManager(BuildManager&&) = default;
    BuildManager& operator=(BuildManager&&) = default;

    /// Statically validates the source without executing it. Throws SyntaxError
    virtual void check_syntax() = 0;

    /// Throws BuildError
    virtual BuildArtifact build() = 0;

    const std::string& get_source() const { return source_; }

    const std::string& get_language() const { return language_; }

    bool is_syntax_ok() const { return syntax_ok_; }

    /// Empty until the workspace has been created
    std::optional<std::filesystem::path> get_workspace_path() const;

protected:
    struct ToolResult
    {
        bool success;
        bool timed_out;

        /// stdout and stderr, interleaved
        std::string output;
    };

    /// Writes the source into the workspace (creating it if needed); idempotent
    std::filesystem::path write_source(std::string_view extension);

    TempWorkspace& workspace();

    /// Runs a compiler/checker inside the workspace. Throws BuildError if it cannot be launched
    ToolResult run_tool(const Command& command, std::chrono::milliseconds timeout);

    void set_syntax_ok() { syntax_ok_ = true; }

private:
    std::string source_;
    std::string language_;
    bool syntax_ok_ = false;

    std::optional<TempWorkspace> workspace_;
    std::optional<std::filesystem::path> source_path_;
};

class CompiledLanguageBuildManager : public BuildManager
{
public:
    CompiledLanguageBuildManager(std::string source, std::string language, CompiledLanguageConfig config);

    /// Runs the syntax check command; without one, a full compilation is the check
    void check_syntax() override;

    BuildArtifact build() override;

    const CompiledLanguageConfig& get_config() const { return config_; }

private:
    CommandPaths get_paths();

    CompiledLanguageConfig config_;
};

class InterpretedLanguageBuildManager : public BuildManager
{
public:
    InterpretedLanguageBuildManager(std::string source, std::string language, InterpretedLanguageConfig config);

    void check_syntax() override;

    /// Nothing to compile; the entry point is the source file itself
    BuildArtifact build() override;

    const InterpretedLanguageConfig& get_config() const { return config_; }

private:
    InterpretedLanguageConfig config_;
};

} // namespace iojudge
