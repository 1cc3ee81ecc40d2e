#include "catch2_custom.hpp"

#include <iojudge/build/temp_workspace.hpp>
#include <iojudge/execution/execution_manager.hpp>
#include <iojudge/judge.hpp>
#include <iojudge/langs/builtin_languages.hpp>
#include <iojudge/registrars/language_registry.hpp>

#include "output/verbosity.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <chrono>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

using namespace std::chrono_literals;

using Catch::Matchers::ContainsSubstring;

using iojudge::CommandLineArgs;
using iojudge::ProgramOptions;
using iojudge::VerbosityLevel;

namespace {

/// A source file and a data file for the command line to point at
struct CliFiles
{
    CliFiles()
        : source{workspace.write_file("solution.sh", "read a\necho $a\n")}
        , data{workspace.write_file("cases.txt", "<1>\n1\n")} {
        // Validation looks languages up in the process-wide registry
        if (!iojudge::LanguageRegistry::get().contains("sh")) {
            iojudge::register_builtin_languages(iojudge::LanguageRegistry::get());
        }
    }

    iojudge::TempWorkspace workspace{"iojudge-cli"};
    std::filesystem::path source;
    std::filesystem::path data;
};

iojudge::Expected<ProgramOptions, std::string> parse(std::initializer_list<std::string> args) {
    std::vector<std::string> storage{"/usr/local/bin/judge"};
    storage.insert(storage.end(), args.begin(), args.end());

    std::vector<const char*> argv;
    for (const std::string& arg : storage) {
        argv.push_back(arg.c_str());
    }

    CommandLineArgs cl_args{argv};
    return cl_args.parse();
}

} // namespace

TEST_CASE("Grade subcommand") {
    CliFiles files;

    auto opts = parse({"grade", files.source.string(), files.data.string(), "-t", "2.5", "-l", "shell", "--raises",
                       "-v", "-j", "4"});

    REQUIRE(opts);
    REQUIRE(opts->subcommand == ProgramOptions::Subcommand::Grade);
    REQUIRE(opts->source_path == files.source);
    REQUIRE(opts->data_path == files.data);
    REQUIRE(opts->timeout == 2500ms);
    REQUIRE(opts->language == "shell");
    REQUIRE(opts->raises);
    REQUIRE(opts->verbosity == VerbosityLevel::All);
    REQUIRE(opts->jobs == 4);
    REQUIRE_FALSE(opts->stream_mode);
}

TEST_CASE("Run subcommand") {
    CliFiles files;

    auto opts = parse({"run", files.source.string(), files.data.string(), "--stream", "-m", "64", "-c", "never", "-q"});

    REQUIRE(opts);
    REQUIRE(opts->subcommand == ProgramOptions::Subcommand::Run);
    REQUIRE(opts->stream_mode);
    REQUIRE(opts->memory_limit_mib == 64);
    REQUIRE(opts->colorize_option == ProgramOptions::ColorizeOpt::Never);
    REQUIRE(opts->verbosity == VerbosityLevel::Quiet);
    REQUIRE_FALSE(opts->language.has_value());
    REQUIRE(opts->get_language_identifier() == ".sh");
}

TEST_CASE("Defaults") {
    CliFiles files;

    auto opts = parse({"grade", files.source.string(), files.data.string()});

    REQUIRE(opts);
    REQUIRE(opts->verbosity == ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
    REQUIRE(opts->timeout == iojudge::DEFAULT_EXECUTION_TIMEOUT);
    REQUIRE(opts->colorize_option == ProgramOptions::ColorizeOpt::Auto);
    REQUIRE(opts->jobs == 1);
    REQUIRE_FALSE(opts->raises);
}

TEST_CASE("Invalid command lines") {
    CliFiles files;

    SECTION("No subcommand") {
        auto opts = parse({});
        REQUIRE_FALSE(opts);
        REQUIRE_THAT(opts.error(), ContainsSubstring("subcommand"));
    }

    SECTION("Missing source file") {
        auto opts = parse({"grade", (files.workspace.path() / "missing.py").string(), files.data.string()});
        REQUIRE_FALSE(opts);
        REQUIRE_THAT(opts.error(), ContainsSubstring("does not exist"));
    }

    SECTION("Directory instead of a file") {
        auto opts = parse({"run", files.source.string(), files.workspace.path().string()});
        REQUIRE_FALSE(opts);
        REQUIRE_THAT(opts.error(), ContainsSubstring("not a regular file"));
    }

    SECTION("Unknown language") {
        auto opts = parse({"grade", files.source.string(), files.data.string(), "--lang", "cobol"});
        REQUIRE_FALSE(opts);
        REQUIRE_THAT(opts.error(), ContainsSubstring("Unknown language \"cobol\""));
    }

    SECTION("Malformed numbers") {
        REQUIRE_FALSE(parse({"grade", files.source.string(), files.data.string(), "-t", "soon"}));
        REQUIRE_FALSE(parse({"grade", files.source.string(), files.data.string(), "-t", "0"}));
        REQUIRE_FALSE(parse({"grade", files.source.string(), files.data.string(), "-j", "4x"}));
    }

    SECTION("Too much verbosity") {
        REQUIRE_FALSE(parse({"grade", files.source.string(), files.data.string(), "-v", "-v", "-v", "-v"}));
    }
}

TEST_CASE("Program options map onto judge options") {
    ProgramOptions opts;
    opts.timeout = 1500ms;
    opts.memory_limit_mib = 256;
    opts.jobs = 0;
    opts.stream_mode = true;
    opts.raises = true;

    iojudge::JudgeOptions judge_opts = opts.to_judge_options();

    REQUIRE(judge_opts.execution.timeout == 1500ms);
    REQUIRE(judge_opts.execution.limits.memory_bytes == 256U * 1024U * 1024U);
    REQUIRE(judge_opts.execution.mode == iojudge::ExecutionMode::Stream);
    REQUIRE(judge_opts.jobs == 0);
    REQUIRE(judge_opts.raises);
    REQUIRE(judge_opts.registry == nullptr);
}

TEST_CASE("Validation clamps verbosity") {
    CliFiles files;

    ProgramOptions opts;
    opts.source_path = files.source;
    opts.data_path = files.data;
    opts.verbosity = static_cast<VerbosityLevel>(42);

    REQUIRE(opts.validate());
    REQUIRE(opts.verbosity == VerbosityLevel::Max);
}
