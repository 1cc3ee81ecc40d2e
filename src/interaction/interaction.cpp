#include <iojudge/interaction/interaction.hpp>

#include <range/v3/algorithm/copy_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

#include <string>
#include <vector>

namespace iojudge {

std::vector<std::string> TestCase::inputs() const {
    return expected | ranges::views::filter([](const Interaction& elem) { return elem.kind == InteractionKind::Input; }) |
           ranges::views::transform(&Interaction::text) | ranges::to<std::vector>();
}

TestCase TestCase::to_stream() const {
    TestCase result;
    std::string all_text;
    // Outputs are stored without their final newline
    bool pending_newline = false;

    for (const Interaction& elem : expected) {
        if (elem.kind == InteractionKind::Input) {
            result.expected.push_back(elem);
            continue;
        }

        if (pending_newline) {
            all_text += '\n';
        }

        all_text += elem.text;
        pending_newline = elem.kind == InteractionKind::Output;
    }

    if (!all_text.empty()) {
        result.expected.push_back(Interaction::output(std::move(all_text)));
    }

    return result;
}

} // namespace iojudge
