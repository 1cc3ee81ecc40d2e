#include "user/cl_args.hpp"

#include <iojudge/common/expected.hpp>
#include <iojudge/logging.hpp>
#include <iojudge/registrars/language_registry.hpp>

#include "common/terminal_checks.hpp"
#include "user/program_options.hpp"
#include "version.hpp"

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <initializer_list>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace iojudge {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), IOJUDGE_VERSION_STRING, argparse::default_arguments::help}
    , run_parser_{"run", IOJUDGE_VERSION_STRING, argparse::default_arguments::help}
    , grade_parser_{"grade", IOJUDGE_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    setup_parser();
}

namespace {

template <typename Number>
Number parse_number(const std::string& str, std::string_view what) {
    std::size_t consumed = 0;
    Number result{};

    try {
        if constexpr (std::is_floating_point_v<Number>) {
            result = static_cast<Number>(std::stod(str, &consumed));
        } else {
            result = static_cast<Number>(std::stoull(str, &consumed));
        }
    } catch (const std::exception&) {
        consumed = 0;
    }

    if (consumed != str.size() || str.empty() || str.front() == '-') {
        throw std::invalid_argument(fmt::format("{} must be a non-negative number, got {:?}", what, str));
    }

    return result;
}

} // namespace

void CommandLineArgs::add_common_arguments(argparse::ArgumentParser& parser) {
    // clang-format off
    parser.add_argument("-l", "--lang")
        .metavar("LANG")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.language = opt; })
        .help(fmt::format("Language key, alias or extension. Inferred from the source file's extension by default.\n"
                          "One of: {}", fmt::join(LanguageRegistry::get().get_language_keys(), ", ")));

    parser.add_argument("-t", "--timeout")
        .metavar("SECONDS")
        .nargs(1)
        .action([this] (const std::string& opt) {
                auto seconds = parse_number<double>(opt, "Timeout");
                if (seconds <= 0) {
                    throw std::invalid_argument("Timeout must be positive");
                }
                opts_buffer_.timeout =
                    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::duration<double>{seconds});
        })
        .help(fmt::format("Wall-clock time limit of each execution (default: {}s)",
                          std::chrono::duration<double>{DEFAULT_EXECUTION_TIMEOUT}.count()));

    parser.add_argument("-m", "--memory")
        .metavar("MIB")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.memory_limit_mib = parse_number<std::size_t>(opt, "Memory limit"); })
        .help(fmt::format("Address space limit of each execution, 0 for none (default: {} MiB)",
                          DEFAULT_MEMORY_LIMIT >> 20U));

    parser.add_argument("-j", "--jobs")
        .metavar("N")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.jobs = parse_number<std::size_t>(opt, "Number of jobs"); })
        .help("Number of test cases to execute concurrently, 0 for one per CPU (default: 1)");

    parser.add_argument("--stream")
        .flag()
        .action([this] (const std::string& /*unused*/) { opts_buffer_.stream_mode = true; })
        .help("Write every input up front and compare whole output streams instead of interacting");

    parser.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });

    {
        // Block to reduce scope of `using enum`

        using enum VerbosityLevel;

        constexpr auto DEFAULT_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
        constexpr auto MAX_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Max);
        constexpr auto MIN_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Silent);

        constexpr auto MAX_VERBOSITY_INCREASE = MAX_VERBOSITY_VALUE - DEFAULT_VERBOSITY_VALUE;
        constexpr auto MAX_VERBOSITY_DECREASE = DEFAULT_VERBOSITY_VALUE - MIN_VERBOSITY_VALUE;

        parser.add_argument("-v", "--verbose")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto level = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) + 1;

                    if (level > MAX_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification exceeds maximum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(level);
                })
            .append()
            .help(fmt::format("Increase verbosity level (up to {}x)", MAX_VERBOSITY_INCREASE));

        parser.add_argument("-q", "--quiet")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto level = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) - 1;

                    if (level < MIN_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification is lower than minimum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(level);
                })
            .append()
            .help(fmt::format("Decrease verbosity level (up to {}x)", MAX_VERBOSITY_DECREASE));

        parser.add_argument("--silent")
            .flag()
            .action([this] (const std::string& /*unused*/) { opts_buffer_.verbosity = Silent; })
            .help("Suppress all output except for the return code. Useful for scripting.");
    }
    // clang-format on
}

void CommandLineArgs::setup_parser() {
    std::size_t max_width = 80;

    if (auto term_sz = terminal_size(stdout)) {
        max_width = term_sz->ws_col * 3U / 4U;
        LOG_DEBUG("Cols = {}, px = {}", term_sz->ws_col, term_sz->ws_xpixel);
    } else {
        LOG_DEBUG("Failed to get terminal size. Setting max width to {}", max_width);
    }

    for (argparse::ArgumentParser* parser : {&arg_parser_, &run_parser_, &grade_parser_}) {
        parser->set_usage_max_line_width(max_width);
    }

    arg_parser_.add_description(fmt::format("iojudge v{}: build, run and grade programs against interaction specs",
                                            IOJUDGE_VERSION_STRING));

    // clang-format off
    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", IOJUDGE_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    run_parser_.add_description("Run a program on each input set and print what it did");

    run_parser_.add_argument("source")
        .action([this] (const std::string& opt) { opts_buffer_.source_path = opt; })
        .help("The program's source file");

    run_parser_.add_argument("inputs")
        .action([this] (const std::string& opt) { opts_buffer_.data_path = opt; })
        .help("File of input values, one per line. Blank lines separate input sets; lines starting with '#' are "
              "comments.");

    add_common_arguments(run_parser_);

    grade_parser_.add_description("Grade a program against the test cases of an interaction spec");

    grade_parser_.add_argument("source")
        .action([this] (const std::string& opt) { opts_buffer_.source_path = opt; })
        .help("The program's source file");

    grade_parser_.add_argument("spec")
        .action([this] (const std::string& opt) { opts_buffer_.data_path = opt; })
        .help("Interaction spec file with the expected transcripts");

    grade_parser_.add_argument("--raises")
        .flag()
        .action([this] (const std::string& /*unused*/) { opts_buffer_.raises = true; })
        .help("Abort with the compiler output when the program does not build");

    add_common_arguments(grade_parser_);
    // clang-format on

    arg_parser_.add_subparser(run_parser_);
    arg_parser_.add_subparser(grade_parser_);
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    if (arg_parser_.is_subcommand_used(run_parser_)) {
        opts_buffer_.subcommand = ProgramOptions::Subcommand::Run;
    } else if (arg_parser_.is_subcommand_used(grade_parser_)) {
        opts_buffer_.subcommand = ProgramOptions::Subcommand::Grade;
    } else {
        return std::string{"A subcommand is required: run or grade"};
    }

    TRY(opts_buffer_.validate());

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    if (arg_parser_.is_subcommand_used(run_parser_)) {
        return run_parser_.help().str();
    }
    if (arg_parser_.is_subcommand_used(grade_parser_)) {
        return grade_parser_.help().str();
    }

    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)),
                   cl_args.help_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace iojudge
