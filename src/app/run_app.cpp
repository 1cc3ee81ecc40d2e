#include "app/run_app.hpp"

#include <iojudge/exceptions.hpp>
#include <iojudge/execution/execution_result.hpp>
#include <iojudge/judge.hpp>
#include <iojudge/logging.hpp>

#include "user/input_sets.hpp"

#include <range/v3/algorithm/all_of.hpp>

#include <cstddef>
#include <cstdlib>
#include <string>
#include <vector>

namespace iojudge {

int RunApp::run_impl() {
    Serializer& serializer = get_serializer();

    const std::string source = read_file(OPTS.source_path);
    const std::vector<std::vector<std::string>> input_sets = parse_input_sets(read_file(OPTS.data_path));

    LOG_DEBUG("Running {} on {} input set(s)", OPTS.source_path.string(), input_sets.size());

    serializer.on_run_metadata(make_run_metadata());

    std::vector<ExecutionResult> results;

    try {
        results = run(source, input_sets, OPTS.get_language_identifier(), OPTS.to_judge_options());
    } catch (const BuildError& err) {
        serializer.on_build_error(err);
        serializer.finalize();
        return EXIT_JUDGE_ERROR;
    } catch (const JudgeError& err) {
        serializer.on_error(err.what());
        serializer.finalize();
        return EXIT_JUDGE_ERROR;
    }

    for (std::size_t i = 0; i < results.size(); ++i) {
        serializer.on_execution(i, input_sets[i], results[i]);
    }

    serializer.finalize();

    const bool all_completed = ranges::all_of(
        results, [](const ExecutionResult& result) { return result.reason == TerminationReason::Completed; });

    return all_completed ? EXIT_SUCCESS : EXIT_FAILURES;
}

} // namespace iojudge
