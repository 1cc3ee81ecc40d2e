#pragma once

#include <iojudge/common/class_traits.hpp>
#include <iojudge/exceptions.hpp>
#include <iojudge/execution/execution_result.hpp>
#include <iojudge/grading/verdict.hpp>
#include <iojudge/interaction/interaction.hpp>
#include <iojudge/judge.hpp>

#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "version.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace iojudge {

struct RunMetadata
{
    std::string version_string = IOJUDGE_VERSION_STRING;
    std::string language;
    std::filesystem::path source_path;
    std::chrono::system_clock::time_point start_time = std::chrono::system_clock::now();
};

/// Receives the events of a `run` or `grade` invocation and writes them to a Sink
class Serializer : NonCopyable
{
public:
    Serializer(Sink& sink, VerbosityLevel verbosity)
        : sink_{sink}
        , verbosity_{verbosity} {}

    virtual ~Serializer() = default;

    virtual void on_run_metadata(const RunMetadata& data) = 0;

    /// `run`: the program did not build, nothing was executed
    virtual void on_build_error(const BuildError& error) = 0;

    /// `run`: one execution per input set, in input set order
    virtual void on_execution(std::size_t index, const std::vector<std::string>& inputs,
                              const ExecutionResult& result) = 0;

    /// `grade`: ``observed`` is null if the program was never executed
    virtual void on_test_result(std::size_t index, const TestCase& expected, const Verdict& verdict,
                                const ExecutionResult* observed) = 0;

    virtual void on_grade_report(const GradeReport& report) = 0;

    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_;
    VerbosityLevel verbosity_;
};

} // namespace iojudge
