#include "catch2_custom.hpp"

#include <iojudge/exceptions.hpp>
#include <iojudge/execution/execution_result.hpp>
#include <iojudge/grading/grader.hpp>
#include <iojudge/grading/verdict.hpp>
#include <iojudge/interaction/interaction.hpp>

#include <string>

using iojudge::ExecutionResult;
using iojudge::Grader;
using iojudge::Interaction;
using iojudge::TerminationReason;
using iojudge::TestCase;
using iojudge::Transcript;
using iojudge::Verdict;
using iojudge::VerdictKind;

namespace {

TestCase sum_test_case(std::string expected_output) {
    return TestCase{{
        Interaction::prompt(""),
        Interaction::input("1"),
        Interaction::prompt(""),
        Interaction::input("5"),
        Interaction::output(std::move(expected_output)),
    }};
}

Transcript sum_transcript(std::string observed_output) {
    return {
        Interaction::prompt(""),
        Interaction::input("1"),
        Interaction::prompt(""),
        Interaction::input("5"),
        Interaction::output(std::move(observed_output)),
    };
}

} // namespace

TEST_CASE("Matching transcripts are correct") {
    Grader grader;

    Verdict verdict = grader.grade(sum_transcript("result: 6"), sum_test_case("result: 6"));

    REQUIRE(verdict.is_correct());
    REQUIRE(verdict.kind == VerdictKind::Correct);
    REQUIRE(!verdict.mismatch.has_value());
}

TEST_CASE("The first differing interaction decides the verdict") {
    Grader grader;

    Verdict verdict = grader.grade(sum_transcript("result: 15"), sum_test_case("result: 6"));

    REQUIRE(verdict.kind == VerdictKind::WrongAnswer);
    REQUIRE(verdict.mismatch.has_value());
    REQUIRE(verdict.mismatch->index == 4);
    REQUIRE(verdict.mismatch->expected == "result: 6");
    REQUIRE(verdict.mismatch->observed == "result: 15");
    REQUIRE_THAT(verdict.message, Catch::Matchers::ContainsSubstring("result: 15"));
}

TEST_CASE("Floating-point outputs are compared with a tolerance") {
    Grader grader;

    REQUIRE(grader.grade(sum_transcript("7"), sum_test_case("7.0")).is_correct());
    REQUIRE(grader.grade(sum_transcript("7.0000000000"), sum_test_case("7.0")).is_correct());
    REQUIRE(grader.grade(sum_transcript("7.1"), sum_test_case("7.0")).kind == VerdictKind::WrongAnswer);
}

TEST_CASE("Whitespace-only differences are presentation errors") {
    Grader grader;

    Verdict verdict = grader.grade(sum_transcript("result:   6"), sum_test_case("result: 6"));

    REQUIRE(verdict.kind == VerdictKind::PresentationError);
    REQUIRE(verdict.mismatch->index == 4);
}

TEST_CASE("Prompts are graded like outputs") {
    Grader grader;

    TestCase expected{{Interaction::prompt("x: "), Interaction::input("a"), Interaction::output("a")}};
    Transcript observed{Interaction::prompt("y: "), Interaction::input("a"), Interaction::output("a")};

    Verdict verdict = grader.grade(observed, expected);

    REQUIRE(verdict.kind == VerdictKind::WrongAnswer);
    REQUIRE(verdict.mismatch->index == 0);
}

TEST_CASE("Missing and extra interactions") {
    Grader grader;

    SECTION("The program stopped early") {
        Transcript observed{Interaction::prompt(""), Interaction::input("1")};

        Verdict verdict = grader.grade(observed, sum_test_case("result: 6"));

        REQUIRE(verdict.kind == VerdictKind::WrongAnswer);
        REQUIRE(verdict.mismatch->index == 2);
        REQUIRE(!verdict.mismatch->observed.has_value());
    }

    SECTION("The program printed more") {
        Transcript observed = sum_transcript("result: 6");
        observed.push_back(Interaction::output("bye"));

        Verdict verdict = grader.grade(observed, sum_test_case("result: 6"));

        REQUIRE(verdict.kind == VerdictKind::WrongAnswer);
        REQUIRE(verdict.mismatch->index == 5);
        REQUIRE(!verdict.mismatch->expected.has_value());
        REQUIRE(verdict.mismatch->observed == "bye");
    }

    SECTION("Only blank text is missing") {
        TestCase expected = sum_test_case("result: 6");
        expected.expected.push_back(Interaction::output(""));

        Verdict verdict = grader.grade(sum_transcript("result: 6"), expected);

        REQUIRE(verdict.kind == VerdictKind::PresentationError);
    }
}

TEST_CASE("An output and a prompt differing only by a line break") {
    Grader grader;

    TestCase expected{{Interaction::output("hi"), Interaction::prompt(""), Interaction::input("x")}};

    SECTION("is a presentation error") {
        Transcript observed{Interaction::prompt("hi"), Interaction::input("x")};

        Verdict verdict = grader.grade(observed, expected);

        REQUIRE(verdict.kind == VerdictKind::PresentationError);
        REQUIRE(verdict.mismatch->index == 0);
        REQUIRE(verdict.mismatch->expected == "hi\n");
        REQUIRE(verdict.mismatch->observed == "hi");
    }

    SECTION("with other text is a wrong answer") {
        Transcript observed{Interaction::prompt("ho"), Interaction::input("x")};

        REQUIRE(grader.grade(observed, expected).kind == VerdictKind::WrongAnswer);
    }

    SECTION("when one side runs out of inputs is a wrong answer") {
        Transcript observed{Interaction::prompt("hi")};

        REQUIRE(grader.grade(observed, expected).kind == VerdictKind::WrongAnswer);
    }
}

TEST_CASE("Alternatives are accepted") {
    Grader grader;

    TestCase expected = sum_test_case("result: 6");
    expected.expected.back().alternatives = {"sum: 6", "six"};

    REQUIRE(grader.grade(sum_transcript("result: 6"), expected).is_correct());
    REQUIRE(grader.grade(sum_transcript("sum: 6"), expected).is_correct());
    REQUIRE(grader.grade(sum_transcript("six"), expected).is_correct());
    REQUIRE(grader.grade(sum_transcript("sum:  6"), expected).kind == VerdictKind::PresentationError);
    REQUIRE(grader.grade(sum_transcript("seven"), expected).kind == VerdictKind::WrongAnswer);
}

TEST_CASE("Value hints are honored") {
    Grader grader;

    TestCase expected = sum_test_case("YES");
    expected.expected.back().hint = iojudge::ValueHint::CaseInsensitive;

    REQUIRE(grader.grade(sum_transcript("yes"), expected).is_correct());
}

TEST_CASE("Grading is idempotent") {
    Grader grader;
    Transcript observed = sum_transcript("result: 15");
    TestCase expected = sum_test_case("result: 6");

    REQUIRE(grader.grade(observed, expected) == grader.grade(observed, expected));
}

TEST_CASE("Inputs that differ from the test case are an internal error") {
    Grader grader;

    Transcript observed = sum_transcript("result: 6");
    observed[1] = Interaction::input("2");

    REQUIRE_THROWS_AS(grader.grade(observed, sum_test_case("result: 6")), iojudge::InternalError);
}

TEST_CASE("Abnormal terminations short-circuit the comparison") {
    Grader grader;

    ExecutionResult result;
    result.transcript = sum_transcript("result: 6");

    SECTION("Timeout") {
        result.reason = TerminationReason::TimedOut;
        result.message = "time limit exceeded";

        Verdict verdict = grader.grade(result, sum_test_case("result: 6"));

        REQUIRE(verdict.kind == VerdictKind::Timeout);
        REQUIRE(verdict.message == "time limit exceeded");
    }

    SECTION("Crash") {
        result.reason = TerminationReason::Crashed;
        result.exit_code = 1;

        REQUIRE(grader.grade(result, sum_test_case("result: 6")).kind == VerdictKind::RuntimeError);
    }

    SECTION("Killed") {
        result.reason = TerminationReason::Killed;

        REQUIRE(grader.grade(result, sum_test_case("result: 6")).kind == VerdictKind::RuntimeError);
    }

    SECTION("Completed") {
        result.exit_code = 0;

        REQUIRE(grader.grade(result, sum_test_case("result: 6")).is_correct());
    }
}

TEST_CASE("Unused inputs are explained") {
    Grader grader;

    ExecutionResult result;
    result.transcript = {Interaction::prompt(""), Interaction::input("1"), Interaction::output("bye")};
    result.exit_code = 0;
    result.unused_inputs = {"5"};
    result.message = "Process closed without consuming all inputs. Unused inputs: [\"5\"]";

    Verdict verdict = grader.grade(result, sum_test_case("result: 6"));

    REQUIRE(verdict.kind == VerdictKind::WrongAnswer);
    REQUIRE_THAT(verdict.message, Catch::Matchers::ContainsSubstring("without consuming all inputs"));
}

TEST_CASE("Build errors carry the compiler output") {
    iojudge::BuildError error{"main.c:1:1: error: expected expression"};

    Verdict verdict = Grader::build_error(error);

    REQUIRE(verdict.kind == VerdictKind::BuildError);
    REQUIRE_THAT(verdict.message, Catch::Matchers::ContainsSubstring("expected expression"));
}
