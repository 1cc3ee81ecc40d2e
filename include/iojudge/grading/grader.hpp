#pragma once

#include <iojudge/execution/execution_result.hpp>
#include <iojudge/grading/text_compare.hpp>
#include <iojudge/grading/verdict.hpp>
#include <iojudge/interaction/interaction.hpp>

#include <cstddef>
#include <optional>

namespace iojudge {

class BuildError;

struct GradingOptions
{
    Tolerance tolerance{};
};

/// Compares observed transcripts against expected test cases. Stateless; grading is idempotent
class Grader
{
public:
    explicit Grader(GradingOptions options = {})
        : options_{options} {}

    /// Short-circuits to Timeout / RuntimeError for executions that did not complete,
    /// otherwise compares the transcripts
    Verdict grade(const ExecutionResult& result, const TestCase& expected) const;

    /// Walks both transcripts pairwise; the first failing index determines the verdict.
    /// Throws InternalError if an observed input differs from the expected one.
    Verdict grade(const Transcript& observed, const TestCase& expected) const;

    /// The verdict of a test case whose program could not be built
    static Verdict build_error(const BuildError& error);

    const GradingOptions& get_options() const { return options_; }

private:
    TextMatch compare(const Interaction& expected, const Interaction& observed) const;

    /// Where an output meets a prompt at ``index``, compares the program text up to the next input on
    /// both sides. PresentationError if it differs only in whitespace or line breaks
    std::optional<Verdict> compare_line_breaks(const Transcript& observed, const Transcript& expected,
                                               std::size_t index) const;

    GradingOptions options_;
};

} // namespace iojudge
