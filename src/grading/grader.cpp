#include <iojudge/grading/grader.hpp>

#include <iojudge/exceptions.hpp>
#include <iojudge/grading/text_compare.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/view/drop.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>

namespace iojudge {

namespace {

bool is_blank_text(const Interaction& elem) {
    return elem.is_program_text() &&
           ranges::all_of(elem.text, [](char chr) { return std::isspace(static_cast<unsigned char>(chr)) != 0; });
}

Verdict mismatch_verdict(VerdictKind kind, std::size_t index, std::optional<std::string> expected,
                         std::optional<std::string> observed, std::string message) {
    return {.kind = kind,
            .mismatch = Mismatch{.index = index, .expected = std::move(expected), .observed = std::move(observed)},
            .message = std::move(message)};
}

/// Index of the first Input at or after ``from``, or the size of ``transcript``
std::size_t next_input(const Transcript& transcript, std::size_t from) {
    while (from < transcript.size() && transcript[from].kind != InteractionKind::Input) {
        ++from;
    }
    return from;
}

/// The terminal text of the program interactions in [from, to): outputs are whole lines, prompts are not
std::string program_text(const Transcript& transcript, std::size_t from, std::size_t to) {
    std::string text;
    for (std::size_t i = from; i < to; ++i) {
        text += transcript[i].text;
        if (transcript[i].kind == InteractionKind::Output) {
            text += '\n';
        }
    }
    return text;
}

} // namespace

Verdict Grader::grade(const ExecutionResult& result, const TestCase& expected) const {
    switch (result.reason) {
    case TerminationReason::TimedOut:
        return {.kind = VerdictKind::Timeout, .mismatch = std::nullopt, .message = result.message};

    case TerminationReason::Crashed:
    case TerminationReason::Killed:
        return {.kind = VerdictKind::RuntimeError, .mismatch = std::nullopt, .message = result.message};

    case TerminationReason::Completed:
        break;
    }

    Verdict verdict = grade(result.transcript, expected);

    // Explain an early exit of the program
    if (!verdict.is_correct() && !result.unused_inputs.empty()) {
        verdict.message = fmt::format("{}\n{}", verdict.message, result.message);
    }

    return verdict;
}

Verdict Grader::grade(const Transcript& observed, const TestCase& expected) const {
    const Transcript& exp = expected.expected;
    const std::size_t common = std::min(exp.size(), observed.size());

    for (std::size_t i = 0; i < common; ++i) {
        const Interaction& exp_elem = exp[i];
        const Interaction& obs_elem = observed[i];

        if (exp_elem.kind == InteractionKind::Input && obs_elem.kind == InteractionKind::Input) {
            // Inputs are supplied by the judge itself
            if (exp_elem.text != obs_elem.text) {
                throw InternalError{fmt::format("input #{} was {:?}, but the test case expects {:?}", i,
                                                obs_elem.text, exp_elem.text)};
            }
            continue;
        }

        if (exp_elem.kind != obs_elem.kind) {
            if (auto verdict = compare_line_breaks(observed, exp, i)) {
                return *verdict;
            }
            return mismatch_verdict(VerdictKind::WrongAnswer, i, exp_elem.text, obs_elem.text,
                                    fmt::format("interaction #{}: expected {} {:?}, but got {} {:?}", i,
                                                exp_elem.kind, exp_elem.text, obs_elem.kind, obs_elem.text));
        }

        switch (compare(exp_elem, obs_elem)) {
        case TextMatch::Equal:
            break;

        case TextMatch::Presentation:
            return mismatch_verdict(VerdictKind::PresentationError, i, exp_elem.text, obs_elem.text,
                                    fmt::format("{} #{} differs only in whitespace: expected {:?}, got {:?}",
                                                exp_elem.kind, i, exp_elem.text, obs_elem.text));

        case TextMatch::Different:
            return mismatch_verdict(VerdictKind::WrongAnswer, i, exp_elem.text, obs_elem.text,
                                    fmt::format("{} #{}: expected {:?}, got {:?}", exp_elem.kind, i,
                                                exp_elem.text, obs_elem.text));
        }
    }

    if (exp.size() > common) {
        const Interaction& missing = exp[common];
        bool only_blank = ranges::all_of(exp | ranges::views::drop(common), is_blank_text);

        return mismatch_verdict(only_blank ? VerdictKind::PresentationError : VerdictKind::WrongAnswer, common,
                                missing.text, std::nullopt,
                                fmt::format("program ended before {} #{}: expected {:?}", missing.kind, common,
                                            missing.text));
    }

    if (observed.size() > common) {
        const Interaction& extra = observed[common];
        bool only_blank = ranges::all_of(observed | ranges::views::drop(common), is_blank_text);

        return mismatch_verdict(only_blank ? VerdictKind::PresentationError : VerdictKind::WrongAnswer, common,
                                std::nullopt, extra.text,
                                fmt::format("unexpected {} #{}: {:?}", extra.kind, common, extra.text));
    }

    return {};
}

std::optional<Verdict> Grader::compare_line_breaks(const Transcript& observed, const Transcript& expected,
                                                  std::size_t index) const {
    if (observed[index].kind == InteractionKind::Input || expected[index].kind == InteractionKind::Input) {
        return std::nullopt;
    }

    const std::size_t exp_end = next_input(expected, index);
    const std::size_t obs_end = next_input(observed, index);

    // Both runs of program text must lead to the same thing: another input, or the end
    if ((exp_end == expected.size()) != (obs_end == observed.size())) {
        return std::nullopt;
    }

    std::string exp_text = program_text(expected, index, exp_end);
    std::string obs_text = program_text(observed, index, obs_end);

    if (compare_text(exp_text, obs_text, expected[index].hint, options_.tolerance) == TextMatch::Different) {
        return std::nullopt;
    }

    return mismatch_verdict(VerdictKind::PresentationError, index, exp_text, obs_text,
                            fmt::format("interaction #{}: output differs only in line breaks: expected {:?}, got {:?}",
                                        index, exp_text, obs_text));
}

Verdict Grader::build_error(const BuildError& error) {
    std::string message = error.get_output().empty() ? std::string{error.what()}
                                                     : fmt::format("{}:\n{}", error.what(), error.get_output());

    return {.kind = VerdictKind::BuildError, .mismatch = std::nullopt, .message = std::move(message)};
}

TextMatch Grader::compare(const Interaction& expected, const Interaction& observed) const {
    TextMatch best = compare_text(expected.text, observed.text, expected.hint, options_.tolerance);

    for (const std::string& alternative : expected.alternatives) {
        if (best == TextMatch::Equal) {
            break;
        }

        TextMatch match = compare_text(alternative, observed.text, expected.hint, options_.tolerance);

        if (match == TextMatch::Equal || (match == TextMatch::Presentation && best == TextMatch::Different)) {
            best = match;
        }
    }

    return best;
}

} // namespace iojudge
