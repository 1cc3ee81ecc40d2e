#include "catch2_custom.hpp"

#include <iojudge/common/which.hpp>
#include <iojudge/iojudge.hpp>

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

using namespace std::chrono_literals;

using iojudge::ExecutionResult;
using iojudge::GradeReport;
using iojudge::Interaction;
using iojudge::JudgeOptions;
using iojudge::TerminationReason;
using iojudge::TestCase;
using iojudge::VerdictKind;

namespace {

const iojudge::LanguageRegistry& builtin_registry() {
    static iojudge::LanguageRegistry registry;
    static std::once_flag registered;

    std::call_once(registered, [] { iojudge::register_builtin_languages(registry); });

    return registry;
}

JudgeOptions local_options() {
    JudgeOptions options;
    options.registry = &builtin_registry();
    return options;
}

TestCase sum_test_case(const std::string& lhs, const std::string& rhs, const std::string& expected_output) {
    return TestCase{{
        Interaction::prompt(""),
        Interaction::input(lhs),
        Interaction::prompt(""),
        Interaction::input(rhs),
        Interaction::output(expected_output),
    }};
}

constexpr const char* SH_SUM = "read a\nread b\necho \"result: $((a + b))\"\n";

} // namespace

TEST_CASE("Grading a correct shell program") {
    GradeReport report = iojudge::grade(SH_SUM, {sum_test_case("1", "5", "result: 6")}, "sh", local_options());

    REQUIRE(report.verdicts.size() == 1);
    REQUIRE(report.executions.size() == 1);
    REQUIRE(report.all_correct());
    REQUIRE(report.num_correct() == 1);
    REQUIRE(report.fraction_correct() == 1.0);
}

TEST_CASE("Grading a wrong shell program") {
    GradeReport report = iojudge::grade("read a\nread b\necho \"result: $((a * 10 + b + 4))\"\n",
                                        {sum_test_case("1", "5", "result: 6")}, "sh", local_options());

    REQUIRE_FALSE(report.all_correct());
    REQUIRE(report.verdicts[0].kind == VerdictKind::WrongAnswer);
    REQUIRE(report.verdicts[0].mismatch->index == 4);
    REQUIRE(report.verdicts[0].mismatch->observed == "result: 19");
    REQUIRE(report.fraction_correct() == 0.0);
}

TEST_CASE("Languages resolve from file extensions") {
    GradeReport report = iojudge::grade(SH_SUM, {sum_test_case("2", "2", "result: 4")}, ".sh", local_options());

    REQUIRE(report.all_correct());
}

TEST_CASE("Grading python programs with prompts") {
    if (!iojudge::which("python3")) {
        SKIP("python3 is not installed");
    }

    const std::string source = "x = input('self: ')\n"
                               "y = input('y: ')\n"
                               "print('result: ' + x + y)\n";

    TestCase expected{{
        Interaction::prompt("self: "),
        Interaction::input("a"),
        Interaction::prompt("y: "),
        Interaction::input("b"),
        Interaction::output("result: ab"),
    }};

    GradeReport report = iojudge::grade(source, {expected}, "python", local_options());

    REQUIRE(report.executions[0].transcript == expected.expected);
    REQUIRE(report.all_correct());

    SECTION("A different prompt is a wrong answer") {
        TestCase other_prompt = expected;
        other_prompt.expected[0] = Interaction::prompt("x: ");

        GradeReport other = iojudge::grade(source, {other_prompt}, "python", local_options());

        REQUIRE(other.verdicts[0].kind == VerdictKind::WrongAnswer);
        REQUIRE(other.verdicts[0].mismatch->index == 0);
    }
}

TEST_CASE("Numeric python output") {
    if (!iojudge::which("python3")) {
        SKIP("python3 is not installed");
    }

    const std::string source = "a = int(input())\n"
                               "b = int(input())\n"
                               "print('result:', (a + b) / 1)\n";

    // Prints "result: 6.0"
    GradeReport report = iojudge::grade(source, {sum_test_case("1", "5", "result: 6.00")}, "py", local_options());

    REQUIRE(report.all_correct());
}

TEST_CASE("Programs that do not build") {
    if (!iojudge::which("gcc")) {
        SKIP("gcc is not installed");
    }

    const std::string source = "#include <stdio.h>\nint main(void) { printf(\"hi\\n\") return 0; }\n";
    std::vector<TestCase> tests{sum_test_case("1", "1", "2"), sum_test_case("2", "2", "4")};

    SECTION("Every test case is a build error") {
        GradeReport report = iojudge::grade(source, tests, "c", local_options());

        REQUIRE(report.verdicts.size() == 2);
        REQUIRE(report.executions.empty());

        for (const auto& verdict : report.verdicts) {
            REQUIRE(verdict.kind == VerdictKind::BuildError);
            REQUIRE_THAT(verdict.message, Catch::Matchers::ContainsSubstring("error"));
        }
    }

    SECTION("Build errors can be raised") {
        JudgeOptions options = local_options();
        options.raises = true;

        REQUIRE_THROWS_AS(iojudge::grade(source, tests, "c", options), iojudge::BuildError);
    }

    SECTION("run always raises") {
        REQUIRE_THROWS_AS(iojudge::run(source, {{"1", "1"}}, "c", local_options()), iojudge::SyntaxError);
    }
}

TEST_CASE("Compiled C programs are graded") {
    if (!iojudge::which("gcc")) {
        SKIP("gcc is not installed");
    }

    const std::string source = "#include <stdio.h>\n"
                               "int main(void) {\n"
                               "    int a, b;\n"
                               "    if (scanf(\"%d %d\", &a, &b) != 2) return 1;\n"
                               "    printf(\"result: %d\\n\", a + b);\n"
                               "    return 0;\n"
                               "}\n";

    GradeReport report = iojudge::grade(source, {sum_test_case("1", "5", "result: 6")}, "c", local_options());

    REQUIRE(report.all_correct());
}

TEST_CASE("Unknown languages are rejected before anything runs") {
    REQUIRE_THROWS_AS(iojudge::grade(SH_SUM, {}, "cobol", local_options()), iojudge::UnknownLanguageError);
    REQUIRE_THROWS_AS(iojudge::run(SH_SUM, {}, ".cbl", local_options()), iojudge::UnknownLanguageError);

    JudgeOptions options = local_options();
    options.raises = true;
    REQUIRE_THROWS_AS(iojudge::grade(SH_SUM, {}, "cobol", options), iojudge::UnknownLanguageError);
}

TEST_CASE("Identical input sets are executed once") {
    // Each process prints its own pid
    std::vector<ExecutionResult> results =
        iojudge::run("read a\necho \"$a $$\"\n", {{"x"}, {"y"}, {"x"}}, "sh", local_options());

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].transcript == results[2].transcript);
    REQUIRE(results[0].transcript != results[1].transcript);
    REQUIRE_THAT(results[1].transcript.back().text, Catch::Matchers::StartsWith("y "));
}

TEST_CASE("Test cases run concurrently keep their order") {
    std::vector<TestCase> tests;
    for (int i = 0; i < 8; ++i) {
        tests.push_back(sum_test_case(std::to_string(i), "100", fmt::format("result: {}", i + 100)));
    }

    JudgeOptions options = local_options();
    options.jobs = 4;

    GradeReport report = iojudge::grade(SH_SUM, tests, "sh", options);

    REQUIRE(report.verdicts.size() == 8);
    REQUIRE(report.all_correct());

    for (std::size_t i = 0; i < 8; ++i) {
        REQUIRE(report.executions[i].transcript[1] == Interaction::input(std::to_string(i)));
    }
}

TEST_CASE("Stream mode grading") {
    JudgeOptions options = local_options();
    options.execution.mode = iojudge::ExecutionMode::Stream;

    TestCase expected{{
        Interaction::prompt("a? "),
        Interaction::input("1"),
        Interaction::prompt("b? "),
        Interaction::input("5"),
        Interaction::output("result: 6"),
    }};

    GradeReport report =
        iojudge::grade("printf 'a? '\nread a\nprintf 'b? '\nread b\necho \"result: $((a + b))\"\n", {expected},
                       "sh", options);

    REQUIRE(report.all_correct());
    REQUIRE(report.executions[0].transcript.size() == 3);
}

TEST_CASE("Timeouts and crashes are reported per test case") {
    JudgeOptions options = local_options();
    options.execution.timeout = 500ms;

    const std::string source = "read a\n"
                               "if [ \"$a\" = loop ]; then while :; do :; done; fi\n"
                               "if [ \"$a\" = crash ]; then exit 2; fi\n"
                               "echo \"$a\"\n";

    auto single = [](const std::string& value, const std::string& output) {
        return TestCase{{Interaction::prompt(""), Interaction::input(value), Interaction::output(output)}};
    };

    GradeReport report =
        iojudge::grade(source, {single("loop", "loop"), single("crash", "crash"), single("ok", "ok")}, "sh", options);

    REQUIRE(report.verdicts[0].kind == VerdictKind::Timeout);
    REQUIRE(report.executions[0].reason == TerminationReason::TimedOut);
    REQUIRE(report.verdicts[1].kind == VerdictKind::RuntimeError);
    REQUIRE(report.verdicts[2].kind == VerdictKind::Correct);
    REQUIRE(report.num_correct() == 1);
}

TEST_CASE("An empty report is fully correct") {
    GradeReport report;

    REQUIRE(report.all_correct());
    REQUIRE(report.fraction_correct() == 1.0);
}
