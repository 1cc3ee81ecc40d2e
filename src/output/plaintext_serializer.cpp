#include "output/plaintext_serializer.hpp"

#include <iojudge/exceptions.hpp>
#include <iojudge/execution/execution_result.hpp>
#include <iojudge/grading/verdict.hpp>
#include <iojudge/interaction/iospec.hpp>
#include <iojudge/judge.hpp>
#include <iojudge/logging.hpp>

#include "common/terminal_checks.hpp"
#include "common/time.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace iojudge {

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity)
    : Serializer{sink, verbosity}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

void PlainTextSerializer::on_run_metadata(const RunMetadata& data) {
    if (!should_output_run_metadata(verbosity_)) {
        return;
    }

    constexpr std::string_view header_text = " Execution Info ";
    constexpr std::string_view version_label = "Version: ";
    constexpr std::string_view language_label = "Language: ";
    constexpr std::string_view source_label = "Source: ";
    constexpr std::string_view date_label = "Date and Time: ";

    std::string local_timepoint_text = to_localtime_string(data.start_time, "%a %b %d %T %Y").value_or("<ERROR>");

    auto labeled_line = [this](std::string_view label, std::string_view text) {
        std::size_t width = terminal_width_ > label.size() ? terminal_width_ - label.size() : 0;
        return fmt::format("{}{:>{}}\n", label, text, width);
    };

    std::string out = fmt::format("{:#^{}}\n", header_text, terminal_width_);
    out += labeled_line(version_label, data.version_string);
    out += labeled_line(language_label, data.language);
    out += labeled_line(source_label, data.source_path.string());
    out += labeled_line(date_label, local_timepoint_text);
    out += LINE_DIVIDER_2EM(terminal_width_) + "\n\n";

    sink_.write(out);
}

void PlainTextSerializer::on_build_error(const BuildError& error) {
    if (verbosity_ == VerbosityLevel::Silent) {
        return;
    }

    std::string out = style_str(fmt::format("Build error: {}", error.what()), ERROR_STYLE) + "\n";

    if (!error.get_output().empty()) {
        out += error.get_output();
        if (error.get_output().back() != '\n') {
            out += "\n";
        }
    }

    sink_.write(out);
}

void PlainTextSerializer::on_execution(std::size_t index, const std::vector<std::string>& inputs,
                                       const ExecutionResult& result) {
    if (!should_output_transcripts(verbosity_)) {
        return;
    }

    std::string header = fmt::format("Input set {} ({} {})", index + 1, inputs.size(), pluralize("input", inputs.size()));
    std::string out = fmt::format("{0}\n{1}\n{0}\n", LINE_DIVIDER(terminal_width_), style_str(header, POP_OUT_STYLE));

    out += iospec::format(result.transcript);

    if (std::string termination = describe_termination(result); !termination.empty()) {
        out += termination + "\n";
    }

    if (should_output_resource_usage(verbosity_)) {
        out += describe_usage(result) + "\n";
    }

    out += "\n";

    sink_.write(out);
}

void PlainTextSerializer::on_test_result(std::size_t index, const TestCase& expected, const Verdict& verdict,
                                         const ExecutionResult* observed) {
    if (!should_output_test_result(verbosity_, verdict.is_correct())) {
        return;
    }

    std::string result_str;

    if (verdict.is_correct()) {
        result_str = style_str("PASSED", SUCCESS_STYLE);
    } else {
        result_str = style_str(fmt::format("FAILED ({})", verdict.kind), ERROR_STYLE);
    }

    std::string out = fmt::format("Test Case {} : {}\n", index + 1, result_str);

    const bool abnormal_exit = verdict.kind == VerdictKind::RuntimeError || verdict.kind == VerdictKind::Timeout;

    if (observed != nullptr && abnormal_exit) {
        // Includes the message of the execution
        out += fmt::format("  {}\n", describe_termination(*observed));
    } else if (!verdict.message.empty()) {
        out += fmt::format("  {}\n", verdict.message);
    }

    if (verdict.mismatch) {
        auto value_text = [this](const std::optional<std::string>& value) {
            if (!value) {
                return std::string{"<nothing>"};
            }
            return style_str(fmt::format("{:?}", *value), VALUE_STYLE);
        };

        out += fmt::format("    expected: {}\n", value_text(verdict.mismatch->expected));
        out += fmt::format("    observed: {}\n", value_text(verdict.mismatch->observed));
    }

    if (observed != nullptr) {
        if (should_output_observed_transcript(verbosity_) && !verdict.is_correct()) {
            out += "  Expected transcript:\n" + indented_transcript(expected.expected, TRANSCRIPT_INDENT);
            out += "  Observed transcript:\n" + indented_transcript(observed->transcript, TRANSCRIPT_INDENT);
        }

        if (should_output_resource_usage(verbosity_)) {
            out += fmt::format("  {}\n", describe_usage(*observed));
        }
    }

    sink_.write(out);
}

void PlainTextSerializer::on_grade_report(const GradeReport& report) {
    if (!should_output_grade_summary(verbosity_)) {
        return;
    }

    std::string out = LINE_DIVIDER_EM(terminal_width_) + "\n";

    const std::size_t num_total = report.verdicts.size();
    const std::size_t num_passed = report.num_correct();
    const std::size_t num_failed = num_total - num_passed;

    if (report.all_correct()) {
        out += fmt::format("{} ({} {})\n", style_str("All test cases passed", SUCCESS_STYLE), num_total,
                           pluralize("test case", num_total));
        sink_.write(out);
        return;
    }

    // We would need >99999 test cases for this to look off
    static constexpr std::size_t field_width = 12;

    std::string total_msg = fmt::format("{} total", num_total);
    std::string passed_msg = style_str(fmt::format("{} passed", num_passed), SUCCESS_STYLE);
    std::string failed_msg = style_str(fmt::format("{} failed", num_failed), ERROR_STYLE);

    out += fmt::format("{0:<{4}}: {1:>{4}} | {2:>{4}} | {3:>{4}}\n", "Test cases", total_msg, passed_msg, failed_msg,
                       field_width);
    out += fmt::format("Score: {:.2f}%\n", report.fraction_correct() * 100.0);

    sink_.write(out);
}

void PlainTextSerializer::on_error(std::string_view what) {
    sink_.write(style_str(what, ERROR_STYLE) + "\n");
}

void PlainTextSerializer::finalize() {
    sink_.flush();
}

std::string PlainTextSerializer::describe_termination(const ExecutionResult& result) const {
    if (result.reason == TerminationReason::Completed && result.unused_inputs.empty()) {
        return "";
    }

    std::string text = fmt::format("{}", result.reason);

    if (result.signal) {
        text += fmt::format(" by signal {}", *result.signal);
    } else if (result.exit_code && *result.exit_code != 0) {
        text += fmt::format(" with exit code {}", *result.exit_code);
    }

    if (!result.message.empty()) {
        text += fmt::format(": {}", result.message);
    }

    return style_str(text, result.reason == TerminationReason::Completed ? WARNING_STYLE : ERROR_STYLE);
}

std::string PlainTextSerializer::describe_usage(const ExecutionResult& result) {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    return fmt::format("[elapsed {}, user {}, system {}, max rss {} KiB]", to_duration_string(result.elapsed),
                       to_duration_string(duration_cast<milliseconds>(result.usage.user_time)),
                       to_duration_string(duration_cast<milliseconds>(result.usage.system_time)),
                       result.usage.max_rss_kb);
}

std::string PlainTextSerializer::indented_transcript(const Transcript& transcript, std::size_t indent) {
    std::string text = iospec::format(transcript);
    std::string out;
    std::string prefix(indent, ' ');

    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }

        out += prefix;
        out.append(text, start, end - start);
        out += '\n';

        start = end + 1;
    }

    return out;
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::string PlainTextSerializer::pluralize(std::string_view root, std::size_t count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

std::size_t PlainTextSerializer::get_terminal_width() {
    auto size = terminal_size(stdout);

    if (!size) {
        LOG_DEBUG("Could not obtain terminal width because {}. Defaulting to {}", size.error().message(),
                  DEFAULT_WIDTH);
        return DEFAULT_WIDTH;
    }

    return size->ws_col != 0 ? size->ws_col : DEFAULT_WIDTH;
}

} // namespace iojudge
