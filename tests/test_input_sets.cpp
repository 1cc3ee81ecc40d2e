#include "catch2_custom.hpp"

#include "user/input_sets.hpp"

#include <string>
#include <vector>

using iojudge::parse_input_sets;

using InputSets = std::vector<std::vector<std::string>>;

TEST_CASE("One value per line") {
    REQUIRE(parse_input_sets("1\n5\n") == InputSets{{"1", "5"}});
    REQUIRE(parse_input_sets("1\n5") == InputSets{{"1", "5"}});
}

TEST_CASE("Blank lines separate input sets") {
    REQUIRE(parse_input_sets("1\n5\n\n2\n3\n") == InputSets{{"1", "5"}, {"2", "3"}});
    REQUIRE(parse_input_sets("\n\n1\n\n\n\n2\n\n") == InputSets{{"1"}, {"2"}});
    REQUIRE(parse_input_sets("a\n   \nb\n") == InputSets{{"a"}, {"b"}});
}

TEST_CASE("Comment lines are skipped") {
    REQUIRE(parse_input_sets("# first set\n1\n# second value\n5\n") == InputSets{{"1", "5"}});

    // A comment does not end a set
    REQUIRE(parse_input_sets("1\n#\n2\n") == InputSets{{"1", "2"}});
}

TEST_CASE("Values keep inner and leading whitespace") {
    REQUIRE(parse_input_sets("  hello world\n") == InputSets{{"  hello world"}});
}

TEST_CASE("Windows line endings") {
    REQUIRE(parse_input_sets("1\r\n5\r\n\r\n2\r\n") == InputSets{{"1", "5"}, {"2"}});
}

TEST_CASE("Empty files run the program once without input") {
    REQUIRE(parse_input_sets("") == InputSets{{}});
    REQUIRE(parse_input_sets("\n\n# nothing here\n") == InputSets{{}});
}
