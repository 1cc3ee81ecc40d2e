#include "catch2_custom.hpp"

#include <iojudge/interaction/interaction.hpp>
#include <iojudge/interaction/iospec.hpp>

#include <string>
#include <vector>

using iojudge::Interaction;
using iojudge::TestCase;
using iojudge::Transcript;
namespace iospec = iojudge::iospec;

TEST_CASE("Prompts, inputs and outputs are parsed") {
    auto cases = iospec::parse("Name: <Alice>\nHello, Alice!\n");

    REQUIRE(cases.size() == 1);
    REQUIRE(cases[0].expected == Transcript{
                                     Interaction::prompt("Name: "),
                                     Interaction::input("Alice"),
                                     Interaction::output("Hello, Alice!"),
                                 });
    REQUIRE(cases[0].inputs() == std::vector<std::string>{"Alice"});
}

TEST_CASE("Blank lines separate test cases and comments are skipped") {
    constexpr auto text = "# greeting program\n"
                          "Name: <Alice>\n"
                          "Hello, Alice!\n"
                          "\n"
                          "\n"
                          "Name: <Bob>\n"
                          "Hello, Bob!\n";

    auto cases = iospec::parse(text);

    REQUIRE(cases.size() == 2);
    REQUIRE(cases[1].inputs() == std::vector<std::string>{"Bob"});
    REQUIRE(cases[1].expected.back() == Interaction::output("Hello, Bob!"));
}

TEST_CASE("Consecutive output lines form a single output") {
    auto cases = iospec::parse("first\nsecond\n<x>\nthird\n");

    REQUIRE(cases.size() == 1);
    REQUIRE(cases[0].expected == Transcript{
                                     Interaction::output("first\nsecond"),
                                     Interaction::prompt(""),
                                     Interaction::input("x"),
                                     Interaction::output("third"),
                                 });
}

TEST_CASE("Several inputs on one line") {
    auto cases = iospec::parse("a: <1> b: <2> done\n");

    REQUIRE(cases.size() == 1);
    REQUIRE(cases[0].expected == Transcript{
                                     Interaction::prompt("a: "),
                                     Interaction::input("1"),
                                     Interaction::prompt(" b: "),
                                     Interaction::input("2"),
                                     Interaction::output(" done"),
                                 });
}

TEST_CASE("Forced output lines and escaped prompts") {
    auto cases = iospec::parse("--> # not a comment\n--> <not an input>\nless \\< than: <3>\n");

    REQUIRE(cases.size() == 1);
    REQUIRE(cases[0].expected == Transcript{
                                     Interaction::output("# not a comment\n<not an input>"),
                                     Interaction::prompt("less < than: "),
                                     Interaction::input("3"),
                                 });
}

TEST_CASE("Formatting round trips") {
    Transcript transcript{
        Interaction::output("Welcome\n# header\n"),
        Interaction::prompt("x < y? "),
        Interaction::input("yes"),
        Interaction::prompt(""),
        Interaction::input("42"),
        Interaction::output(""),
    };

    auto cases = iospec::parse(iospec::format(transcript));

    REQUIRE(cases.size() == 1);
    REQUIRE(cases[0].expected == transcript);
}

TEST_CASE("Formatting escapes text that would change meaning") {
    auto round_trip = [](const Transcript& transcript) {
        auto cases = iospec::parse(iospec::format(transcript));
        REQUIRE(cases.size() == 1);
        return cases[0].expected;
    };

    SECTION("Prompt that looks like a comment") {
        Transcript transcript{Interaction::prompt("# of items: "), Interaction::input("3"),
                              Interaction::output("ok")};

        REQUIRE(iospec::format(transcript) == "\\# of items: <3>\nok\n");
        REQUIRE(round_trip(transcript) == transcript);
    }

    SECTION("Prompt that looks like forced output") {
        Transcript transcript{Interaction::prompt("--> "), Interaction::input("go")};

        REQUIRE(round_trip(transcript) == transcript);
    }

    SECTION("Prompt ending in a backslash") {
        Transcript transcript{Interaction::prompt("C:\\"), Interaction::input("dir")};

        REQUIRE(round_trip(transcript) == transcript);
    }

    SECTION("Input values with angle brackets") {
        Transcript transcript{Interaction::prompt("expr: "), Interaction::input("a > b"),
                              Interaction::prompt("tag: "), Interaction::input("<br>")};

        REQUIRE(iospec::format(transcript) == "expr: <a \\> b>\ntag: <\\<br\\>>\n");
        REQUIRE(round_trip(transcript) == transcript);
    }

    SECTION("Second prompt on a line is not a comment") {
        TestCase parsed = iospec::parse("a: <1> # b: <2>\n")[0];

        REQUIRE(parsed.expected[2] == Interaction::prompt(" # b: "));
    }
}

TEST_CASE("Formatting several test cases") {
    std::vector<TestCase> cases{
        TestCase{{Interaction::prompt("n: "), Interaction::input("1"), Interaction::output("one")}},
        TestCase{{Interaction::prompt("n: "), Interaction::input("2"), Interaction::output("two")}},
    };

    std::string text = iospec::format(cases);

    REQUIRE(text == "n: <1>\none\n\nn: <2>\ntwo\n");
    REQUIRE(iospec::parse(text) == cases);
}

TEST_CASE("Stream conversion concatenates program text") {
    TestCase test_case{{
        Interaction::prompt("x: "),
        Interaction::input("a"),
        Interaction::output("got a"),
        Interaction::prompt("y: "),
        Interaction::input("b"),
        Interaction::output("result: ab"),
    }};

    TestCase stream = test_case.to_stream();

    REQUIRE(stream.expected == Transcript{
                                   Interaction::input("a"),
                                   Interaction::input("b"),
                                   Interaction::output("x: got a\ny: result: ab"),
                               });
}
