#include <iojudge/judge.hpp>

#include <iojudge/build/build_manager.hpp>
#include <iojudge/exceptions.hpp>
#include <iojudge/execution/execution_manager.hpp>
#include <iojudge/grading/grader.hpp>
#include <iojudge/logging.hpp>
#include <iojudge/registrars/language_registry.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace iojudge {

namespace {

/// A built program. The artifact is only valid while ``builder`` is alive
struct PreparedProgram
{
    LanguageRegistration language;
    std::unique_ptr<BuildManager> builder;
    BuildArtifact artifact;
};

PreparedProgram prepare(const std::string& source, std::string_view language, const JudgeOptions& options) {
    const LanguageRegistry& registry = options.registry != nullptr ? *options.registry : LanguageRegistry::get();

    PreparedProgram program{.language = registry.resolve(language), .builder = nullptr, .artifact = {}};
    program.builder = program.language.make_build_manager(source);

    program.builder->check_syntax();
    program.artifact = program.builder->build();

    return program;
}

std::size_t num_workers(const JudgeOptions& options, std::size_t num_tasks) {
    std::size_t jobs = options.jobs != 0 ? options.jobs : std::max(1U, std::thread::hardware_concurrency());

    return std::max<std::size_t>(1, std::min(jobs, num_tasks));
}

/// Executes every distinct input sequence once, on a pool of worker threads.
/// Each execution gets its own ExecutionManager and process.
std::vector<ExecutionResult> execute_all(const PreparedProgram& program,
                                         const std::vector<std::vector<std::string>>& input_sets,
                                         const JudgeOptions& options, const std::stop_token& stop) {
    std::vector<std::vector<std::string>> distinct;
    std::vector<std::size_t> slots;
    slots.reserve(input_sets.size());

    std::map<std::vector<std::string>, std::size_t> seen;
    for (const auto& inputs : input_sets) {
        auto [iter, inserted] = seen.try_emplace(inputs, distinct.size());
        if (inserted) {
            distinct.push_back(inputs);
        }
        slots.push_back(iter->second);
    }

    std::vector<std::optional<ExecutionResult>> results(distinct.size());
    std::vector<std::exception_ptr> errors(distinct.size());
    std::atomic<std::size_t> next_task{0};

    auto worker = [&] {
        for (std::size_t task = next_task++; task < distinct.size(); task = next_task++) {
            try {
                auto manager = program.language.make_execution_manager(program.artifact, options.execution);
                results[task] = manager->execute(distinct[task], stop);
            } catch (...) {
                // Rethrown on the calling thread once every worker is done
                errors[task] = std::current_exception();
            }
        }
    };

    const std::size_t workers = num_workers(options, distinct.size());
    LOG_DEBUG("Executing {} distinct input set(s) on {} worker(s)", distinct.size(), workers);

    if (workers == 1) {
        worker();
    } else {
        std::vector<std::jthread> pool;
        pool.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i) {
            pool.emplace_back(worker);
        }
        // jthreads join on destruction
    }

    for (const std::exception_ptr& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    std::vector<ExecutionResult> ordered;
    ordered.reserve(slots.size());

    for (std::size_t slot : slots) {
        ASSERT(results[slot].has_value());
        ordered.push_back(*results[slot]);
    }

    return ordered;
}

} // namespace

bool GradeReport::all_correct() const {
    return ranges::all_of(verdicts, &Verdict::is_correct);
}

std::size_t GradeReport::num_correct() const {
    return gsl::narrow_cast<std::size_t>(ranges::count_if(verdicts, &Verdict::is_correct));
}

double GradeReport::fraction_correct() const {
    if (verdicts.empty()) {
        return 1.0;
    }

    return static_cast<double>(num_correct()) / static_cast<double>(verdicts.size());
}

std::vector<ExecutionResult> run(const std::string& source, const std::vector<std::vector<std::string>>& input_sets,
                                 std::string_view language, const JudgeOptions& options, std::stop_token stop) {
    PreparedProgram program = prepare(source, language, options);

    return execute_all(program, input_sets, options, stop);
}

GradeReport grade(const std::string& source, const std::vector<TestCase>& test_cases, std::string_view language,
                  const JudgeOptions& options, std::stop_token stop) {
    GradeReport report;
    std::optional<PreparedProgram> program;

    try {
        program = prepare(source, language, options);
    } catch (const BuildError& err) {
        if (options.raises) {
            throw;
        }

        LOG_INFO("Build failed ({}); every test case is a build error", err.what());
        report.verdicts.assign(test_cases.size(), Grader::build_error(err));

        return report;
    }

    const bool stream_mode = options.execution.mode == ExecutionMode::Stream;

    std::vector<std::vector<std::string>> input_sets =
        test_cases | ranges::views::transform(&TestCase::inputs) | ranges::to<std::vector>();

    report.executions = execute_all(*program, input_sets, options, stop);

    Grader grader{options.grading};

    for (std::size_t i = 0; i < test_cases.size(); ++i) {
        const TestCase expected = stream_mode ? test_cases[i].to_stream() : test_cases[i];
        report.verdicts.push_back(grader.grade(report.executions[i], expected));
    }

    LOG_INFO("Graded {} test case(s): {} correct", report.verdicts.size(), report.num_correct());

    return report;
}

} // namespace iojudge
