#include "catch2_custom.hpp"

#include <iojudge/build/build_manager.hpp>
#include <iojudge/build/temp_workspace.hpp>
#include <iojudge/common/which.hpp>
#include <iojudge/exceptions.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

namespace fs = std::filesystem;

using iojudge::BuildArtifact;
using iojudge::BuildError;
using iojudge::CompiledLanguageBuildManager;
using iojudge::CompiledLanguageConfig;
using iojudge::InterpretedLanguageBuildManager;
using iojudge::InterpretedLanguageConfig;
using iojudge::SyntaxError;
using iojudge::TempWorkspace;

namespace {

std::string read_whole_file(const fs::path& path) {
    std::ifstream file{path};
    return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

InterpretedLanguageConfig sh_config() {
    return {.source_extension = "sh",
            .interpreter_command = {"sh", "{source}"},
            .syntax_check_command = {"sh", "-n", "{source}"}};
}

CompiledLanguageConfig gcc_config() {
    return {.source_extension = "c",
            .build_command = {"gcc", "-o", "{executable}", "{source}"},
            .syntax_check_command = {"gcc", "-fsyntax-only", "{source}"}};
}

} // namespace

TEST_CASE("Temporary workspaces are removed on destruction") {
    fs::path path;

    {
        TempWorkspace workspace{"iojudge-test"};
        path = workspace.path();

        REQUIRE(fs::is_directory(path));
        REQUIRE_THAT(path.filename().string(), Catch::Matchers::StartsWith("iojudge-test-"));

        fs::path file = workspace.write_file("nested/file.txt", "contents");
        REQUIRE(file == path / "nested/file.txt");
        REQUIRE(read_whole_file(file) == "contents");
    }

    REQUIRE_FALSE(fs::exists(path));
}

TEST_CASE("Temporary workspaces refuse to write outside themselves") {
    TempWorkspace workspace;

    REQUIRE_THROWS_AS(workspace.write_file("../escaped.txt", "x"), iojudge::JudgeError);
    REQUIRE_THROWS_AS(workspace.write_file("/tmp/escaped.txt", "x"), iojudge::JudgeError);
    REQUIRE_FALSE(fs::exists(workspace.path().parent_path() / "escaped.txt"));
}

TEST_CASE("Moved-from workspaces do not remove anything") {
    std::optional<TempWorkspace> original{std::in_place};
    fs::path path = original->path();

    TempWorkspace moved{std::move(*original)};
    original.reset();

    REQUIRE(fs::is_directory(path));

    moved.release();
    REQUIRE_FALSE(fs::exists(path));

    // Releasing twice is harmless
    moved.release();
}

TEST_CASE("Interpreted sources are written as-is") {
    InterpretedLanguageBuildManager builder{"echo hello\n", "sh", sh_config()};

    REQUIRE_FALSE(builder.get_workspace_path().has_value());

    BuildArtifact artifact = builder.build();

    REQUIRE(artifact.language == "sh");
    REQUIRE(artifact.entry_point == artifact.source_path);
    REQUIRE(artifact.source_path.filename() == "main.sh");
    REQUIRE(read_whole_file(artifact.source_path) == "echo hello\n");
    REQUIRE(builder.get_workspace_path() == artifact.workspace);
}

TEST_CASE("Interpreted syntax checks") {
    SECTION("Valid source") {
        InterpretedLanguageBuildManager builder{"if true; then echo ok; fi\n", "sh", sh_config()};

        REQUIRE_NOTHROW(builder.check_syntax());
        REQUIRE(builder.is_syntax_ok());
        REQUIRE(builder.build().syntax_ok);
    }

    SECTION("Invalid source") {
        InterpretedLanguageBuildManager builder{"if true; then echo ok\n", "sh", sh_config()};

        REQUIRE_THROWS_AS(builder.check_syntax(), SyntaxError);
        REQUIRE_FALSE(builder.is_syntax_ok());
    }

    SECTION("No checker available") {
        InterpretedLanguageConfig config = sh_config();
        config.syntax_check_command.clear();

        InterpretedLanguageBuildManager builder{"this is not shell (", "sh", config};

        REQUIRE_NOTHROW(builder.check_syntax());
        REQUIRE(builder.is_syntax_ok());
    }
}

TEST_CASE("Workspaces are cleaned up with their build manager") {
    fs::path workspace;

    {
        InterpretedLanguageBuildManager builder{"echo hi\n", "sh", sh_config()};
        workspace = builder.build().workspace;

        REQUIRE(fs::is_directory(workspace));
    }

    REQUIRE_FALSE(fs::exists(workspace));
}

TEST_CASE("Missing build tools are build errors") {
    CompiledLanguageConfig config{.source_extension = "c",
                                  .build_command = {"iojudge-no-such-compiler", "{source}"},
                                  .syntax_check_command = {}};

    CompiledLanguageBuildManager builder{"int main() {}", "c", config};

    REQUIRE_THROWS_AS(builder.build(), BuildError);
}

TEST_CASE("Compiled languages") {
    if (!iojudge::which("gcc")) {
        SKIP("gcc is not installed");
    }

    SECTION("Successful build") {
        CompiledLanguageBuildManager builder{"int main(void) { return 0; }\n", "c", gcc_config()};

        builder.check_syntax();
        BuildArtifact artifact = builder.build();

        REQUIRE(artifact.syntax_ok);
        REQUIRE(artifact.entry_point.filename() == "main.exe");
        REQUIRE(fs::is_regular_file(artifact.entry_point));
        REQUIRE(artifact.source_path.filename() == "main.c");
    }

    SECTION("Syntax errors carry the compiler output") {
        CompiledLanguageBuildManager builder{"int main(void) { return 0 }\n", "c", gcc_config()};

        try {
            builder.check_syntax();
            FAIL("syntax check should have failed");
        } catch (const SyntaxError& err) {
            REQUIRE_THAT(err.get_output(), Catch::Matchers::ContainsSubstring("error"));
        }
    }

    SECTION("Without a syntax checker, compilation is the check") {
        CompiledLanguageConfig config = gcc_config();
        config.syntax_check_command.clear();

        CompiledLanguageBuildManager builder{"int main(void) { return 0 }\n", "c", config};

        REQUIRE_THROWS_AS(builder.check_syntax(), SyntaxError);
    }

    SECTION("Link errors are build errors, not syntax errors") {
        CompiledLanguageBuildManager builder{"int undefined_function(void);\n"
                                             "int main(void) { return undefined_function(); }\n",
                                             "c", gcc_config()};

        REQUIRE_NOTHROW(builder.check_syntax());

        try {
            (void)builder.build();
            FAIL("build should have failed");
        } catch (const SyntaxError&) {
            FAIL("a link error is not a syntax error");
        } catch (const BuildError& err) {
            REQUIRE_THAT(err.get_output(), Catch::Matchers::ContainsSubstring("undefined_function"));
        }
    }
}
