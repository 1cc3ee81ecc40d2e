#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace iojudge {

/// Reads the input file of `judge run`: one value per line, blank lines separate input sets,
/// lines starting with '#' are comments. Always yields at least one (possibly empty) set.
std::vector<std::vector<std::string>> parse_input_sets(std::string_view text);

} // namespace iojudge
