#include "app/app.hpp"

#include <iojudge/exceptions.hpp>
#include <iojudge/logging.hpp>

#include "output/serializer.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace iojudge {

std::string App::read_file(const std::filesystem::path& path) {
    std::ifstream file{path, std::ios::binary};

    if (!file) {
        throw JudgeError{fmt::format("could not open {:?}", path.string())};
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    if (file.bad()) {
        throw JudgeError{fmt::format("could not read {:?}", path.string())};
    }

    LOG_DEBUG("Read {} bytes from {}", contents.view().size(), path.string());

    return std::move(contents).str();
}

RunMetadata App::make_run_metadata() const {
    return RunMetadata{.language = OPTS.get_language_identifier(), .source_path = OPTS.source_path};
}

} // namespace iojudge
