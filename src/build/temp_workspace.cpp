#include <iojudge/build/temp_workspace.hpp>

#include <iojudge/exceptions.hpp>
#include <iojudge/logging.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <stdlib.h>

namespace iojudge {

TempWorkspace::TempWorkspace(std::string_view prefix) {
    std::error_code err;
    std::filesystem::path tmp_dir = std::filesystem::temp_directory_path(err);

    if (err) {
        tmp_dir = "/tmp";
    }

    // mkdtemp modifies the template in-place
    std::string templ = (tmp_dir / fmt::format("{}-XXXXXX", prefix)).string();

    if (::mkdtemp(templ.data()) == nullptr) {
        throw JudgeError{fmt::format("could not create temporary workspace {:?}: {}", templ, get_err_msg())};
    }

    path_ = templ;
    LOG_DEBUG("Created workspace {}", path_.string());
}

TempWorkspace::~TempWorkspace() {
    release();
}

TempWorkspace::TempWorkspace(TempWorkspace&& other) noexcept
    : path_{std::exchange(other.path_, {})} {}

TempWorkspace& TempWorkspace::operator=(TempWorkspace&& rhs) noexcept {
    if (this != &rhs) {
        release();
        path_ = std::exchange(rhs.path_, {});
    }

    return *this;
}

void TempWorkspace::release() noexcept {
    if (path_.empty()) {
        return;
    }

    std::error_code err;
    std::filesystem::remove_all(path_, err);

    if (err) {
        LOG_WARN("Failed to remove workspace {}: {}", path_.string(), err.message());
    } else {
        LOG_DEBUG("Removed workspace {}", path_.string());
    }

    path_.clear();
}

std::filesystem::path TempWorkspace::write_file(const std::filesystem::path& relative, std::string_view contents) const {
    auto is_parent_ref = [](const std::filesystem::path& part) { return part == ".."; };

    if (relative.empty() || relative.is_absolute() || std::any_of(relative.begin(), relative.end(), is_parent_ref)) {
        throw JudgeError{fmt::format("refusing to write {:?} outside of the workspace", relative.string())};
    }

    std::filesystem::path full_path = path_ / relative;

    if (std::error_code err; !std::filesystem::create_directories(full_path.parent_path(), err) && err) {
        throw JudgeError{fmt::format("failed to create {}: {}", full_path.parent_path().string(), err.message())};
    }

    std::ofstream out{full_path, std::ios::binary | std::ios::trunc};

    if (!out || !out.write(contents.data(), static_cast<std::streamsize>(contents.size())) || !out.flush()) {
        throw JudgeError{fmt::format("failed to write {}", full_path.string())};
    }

    return full_path;
}

} // namespace iojudge
