#pragma once

#include <iojudge/common/class_traits.hpp>

#include "app/trace_exception.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/stdout_sink.hpp"
#include "user/program_options.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace iojudge {

class App : NonCopyable
{
public:
    explicit App(ProgramOptions opts)
        : OPTS{std::move(opts)}
        , serializer_{sink_, OPTS.colorize_option, OPTS.verbosity} {}

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        return res.value_or(EXIT_UNHANDLED_ERROR);
    }

    /// Some execution did not complete, or some test case was not correct
    static constexpr int EXIT_FAILURES = 1;
    /// The program could not be judged (it does not build, or could not be launched)
    static constexpr int EXIT_JUDGE_ERROR = 3;
    static constexpr int EXIT_UNHANDLED_ERROR = 4;

    const ProgramOptions OPTS;

protected:
    virtual int run_impl() = 0;

    /// Whole contents of `path`. Throws JudgeError
    static std::string read_file(const std::filesystem::path& path);

    RunMetadata make_run_metadata() const;

    Serializer& get_serializer() { return serializer_; }

private:
    StdoutSink sink_;
    PlainTextSerializer serializer_;
};

} // namespace iojudge
