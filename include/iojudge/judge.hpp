#pragma once

#include <iojudge/execution/execution_manager.hpp>
#include <iojudge/execution/execution_result.hpp>
#include <iojudge/grading/grader.hpp>
#include <iojudge/grading/verdict.hpp>
#include <iojudge/interaction/interaction.hpp>
#include <iojudge/registrars/language_registry.hpp>

#include <cstddef>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace iojudge {

struct JudgeOptions
{
    ExecutionConfig execution{};
    GradingOptions grading{};

    /// Maximum number of test cases executed concurrently. 0: one per hardware thread
    std::size_t jobs = 1;

    /// ``grade`` only: rethrow build failures instead of reporting a BuildError verdict per test case
    bool raises = false;

    /// null: ``LanguageRegistry::get()``
    const LanguageRegistry* registry = nullptr;
};

/// Verdicts of one submission, in test case order
struct GradeReport
{
    std::vector<Verdict> verdicts;

    /// Empty if the program could not be built
    std::vector<ExecutionResult> executions;

    bool all_correct() const;

    std::size_t num_correct() const;

    /// In [0, 1]; 1 for an empty report
    double fraction_correct() const;
};

/// Builds ``source`` once and executes it once per distinct input sequence.
/// Throws UnknownLanguageError, SyntaxError or BuildError before anything is executed.
std::vector<ExecutionResult> run(const std::string& source, const std::vector<std::vector<std::string>>& input_sets,
                                 std::string_view language, const JudgeOptions& options = {},
                                 std::stop_token stop = {});

/// Builds ``source`` once and grades every test case independently; always yields one verdict per test case
/// unless ``options.raises`` is set and the build fails. Throws UnknownLanguageError.
GradeReport grade(const std::string& source, const std::vector<TestCase>& test_cases, std::string_view language,
                  const JudgeOptions& options = {}, std::stop_token stop = {});

} // namespace iojudge
