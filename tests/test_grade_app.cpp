#include "catch2_custom.hpp"

#include <iojudge/build/temp_workspace.hpp>
#include <iojudge/langs/builtin_languages.hpp>
#include <iojudge/registrars/language_registry.hpp>

#include "app/grade_app.hpp"
#include "user/program_options.hpp"

#include <string_view>

using iojudge::GradeApp;
using iojudge::ProgramOptions;

namespace {

ProgramOptions grade_options(const iojudge::TempWorkspace& workspace, std::string_view spec) {
    if (!iojudge::LanguageRegistry::get().contains("sh")) {
        iojudge::register_builtin_languages(iojudge::LanguageRegistry::get());
    }

    ProgramOptions opts;
    opts.subcommand = ProgramOptions::Subcommand::Grade;
    opts.source_path = workspace.write_file("solution.sh", "read a\nread b\necho \"sum: $((a + b))\"\n");
    opts.data_path = workspace.write_file("cases.txt", spec);
    opts.colorize_option = ProgramOptions::ColorizeOpt::Never;

    return opts;
}

} // namespace

TEST_CASE("Grade exit statuses") {
    iojudge::TempWorkspace workspace{"iojudge-grade-app"};

    SECTION("All test cases correct") {
        GradeApp app{grade_options(workspace, "<1>\n<5>\nsum: 6\n\n<2>\n<2>\nsum: 4\n")};

        REQUIRE(app.run() == 0);
    }

    SECTION("A wrong answer") {
        GradeApp app{grade_options(workspace, "<1>\n<5>\nsum: 7\n")};

        REQUIRE(app.run() == GradeApp::EXIT_FAILURES);
    }

    SECTION("A spec without test cases cannot be graded") {
        GradeApp app{grade_options(workspace, "# nothing here\n\n")};

        REQUIRE(app.run() == GradeApp::EXIT_JUDGE_ERROR);
    }
}
