#include "app/grade_app.hpp"

#include <iojudge/exceptions.hpp>
#include <iojudge/interaction/interaction.hpp>
#include <iojudge/interaction/iospec.hpp>
#include <iojudge/judge.hpp>
#include <iojudge/logging.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <cstdlib>
#include <string>
#include <vector>

namespace iojudge {

int GradeApp::run_impl() {
    Serializer& serializer = get_serializer();

    const std::string source = read_file(OPTS.source_path);
    const std::vector<TestCase> test_cases = iospec::parse(read_file(OPTS.data_path));

    serializer.on_run_metadata(make_run_metadata());

    if (test_cases.empty()) {
        serializer.on_error(fmt::format("cannot grade against {}: it contains no test cases", OPTS.data_path.string()));
        serializer.finalize();
        return EXIT_JUDGE_ERROR;
    }

    GradeReport report;

    try {
        report = grade(source, test_cases, OPTS.get_language_identifier(), OPTS.to_judge_options());
    } catch (const BuildError& err) {
        // Only reachable with --raises
        serializer.on_build_error(err);
        serializer.finalize();
        return EXIT_JUDGE_ERROR;
    } catch (const JudgeError& err) {
        serializer.on_error(err.what());
        serializer.finalize();
        return EXIT_JUDGE_ERROR;
    }

    for (std::size_t i = 0; i < test_cases.size(); ++i) {
        const ExecutionResult* observed = report.executions.empty() ? nullptr : &report.executions[i];
        serializer.on_test_result(i, test_cases[i], report.verdicts[i], observed);
    }

    serializer.on_grade_report(report);
    serializer.finalize();

    LOG_DEBUG("Score: {}/{}", report.num_correct(), report.verdicts.size());

    return report.all_correct() ? EXIT_SUCCESS : EXIT_FAILURES;
}

} // namespace iojudge
