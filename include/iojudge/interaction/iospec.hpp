#pragma once

#include <iojudge/interaction/interaction.hpp>

#include <string>
#include <string_view>
#include <vector>

/// Reader/writer for the plain-text interaction format
///
/// Example (two test cases):
///
///     # greeting program
///     Name: <Alice>
///     Hello, Alice!
///
///     Name: <Bob>
///     Hello, Bob!
///
/// `<value>` marks an input; text before it on the same line is the prompt.
/// Any other line is expected output. A line starting with `-->` is always output.
/// In prompts and input values, a backslash escapes `<`, `>`, `\`, and a leading `#` or `-->`.
namespace iojudge::iospec {

/// Parses every test case in `text`. Blocks separated by blank lines are independent test cases.
std::vector<TestCase> parse(std::string_view text);

/// Writes `transcript` in the format accepted by ``parse``
std::string format(const Transcript& transcript);

/// Writes every test case, separated by blank lines
std::string format(const std::vector<TestCase>& test_cases);

} // namespace iojudge::iospec
