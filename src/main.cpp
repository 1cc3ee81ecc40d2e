#include <iojudge/langs/builtin_languages.hpp>
#include <iojudge/logging.hpp>
#include <iojudge/registrars/language_registry.hpp>

#include "app/app.hpp"
#include "app/grade_app.hpp"
#include "app/run_app.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <cstddef>
#include <memory>
#include <span>

int main(int argc, const char* argv[]) {
    using namespace iojudge;

    init_loggers();

    register_builtin_languages(LanguageRegistry::get());

    LOG_TRACE("Registered languages: {}", LanguageRegistry::get().get_num_registered());

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    const ProgramOptions options = parse_args_or_exit(args);

    std::unique_ptr<App> app;

    switch (options.subcommand) {
    case ProgramOptions::Subcommand::Run:
        app = std::make_unique<RunApp>(options);
        break;
    case ProgramOptions::Subcommand::Grade:
        app = std::make_unique<GradeApp>(options);
        break;
    }

    return app->run();
}
