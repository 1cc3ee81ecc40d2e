#include "catch2_custom.hpp"

#include <iojudge/common/command.hpp>
#include <iojudge/common/which.hpp>

#include <stdexcept>

using iojudge::Command;
using iojudge::CommandPaths;
using iojudge::expand_command;
using iojudge::which;

TEST_CASE("which locates programs in PATH") {
    auto shell = which("sh");

    REQUIRE(shell.has_value());
    REQUIRE(shell->ends_with("/sh"));

    // Cached lookups give the same answer
    REQUIRE(which("sh") == shell);

    REQUIRE(!which("definitely-not-a-real-program-name").has_value());
}

TEST_CASE("which accepts paths to executables") {
    REQUIRE(which("/bin/sh") == "/bin/sh");
    REQUIRE(!which("/nonexistent/sh").has_value());
    REQUIRE(!which("/etc/passwd").has_value());
}

TEST_CASE("Command templates are expanded") {
    CommandPaths paths{.source = "/w/main.c", .executable = "/w/main.exe", .workspace = "/w"};

    Command expanded = expand_command({"gcc", "-o", "{executable}", "{source}", "-I{workspace}"}, paths);

    REQUIRE(expanded == Command{"gcc", "-o", "/w/main.exe", "/w/main.c", "-I/w"});

    REQUIRE_THROWS_AS(expand_command({"gcc", "{unknown}"}, paths), std::invalid_argument);
    REQUIRE_THROWS_AS(expand_command({"gcc", "{source"}, paths), std::invalid_argument);
}
