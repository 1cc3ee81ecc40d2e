#include <iojudge/common/command.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace iojudge {

Command expand_command(const Command& templ, const CommandPaths& paths) {
    Command result;
    result.reserve(templ.size());

    for (const std::string& arg : templ) {
        try {
            result.push_back(fmt::format(fmt::runtime(arg), fmt::arg("source", paths.source),
                                         fmt::arg("executable", paths.executable),
                                         fmt::arg("workspace", paths.workspace)));
        } catch (const fmt::format_error& err) {
            throw std::invalid_argument{fmt::format("bad command template argument {:?}: {}", arg, err.what())};
        }
    }

    return result;
}

} // namespace iojudge
