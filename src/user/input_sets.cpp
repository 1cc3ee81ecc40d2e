#include "user/input_sets.hpp"

#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>

#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace iojudge {

std::vector<std::vector<std::string>> parse_input_sets(std::string_view text) {
    std::vector<std::vector<std::string>> sets;
    std::vector<std::string> current;

    auto is_blank = [](const std::string& line) {
        return ranges::all_of(line, [](unsigned char chr) { return std::isspace(chr) != 0; });
    };

    for (auto&& rng : text | ranges::views::split('\n')) {
        auto line = rng | ranges::to<std::string>();

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (is_blank(line)) {
            if (!current.empty()) {
                sets.push_back(std::move(current));
                current.clear();
            }
            continue;
        }

        if (line.front() == '#') {
            continue;
        }

        current.push_back(std::move(line));
    }

    if (!current.empty() || sets.empty()) {
        sets.push_back(std::move(current));
    }

    return sets;
}

} // namespace iojudge
