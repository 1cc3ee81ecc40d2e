#include <iojudge/common/which.hpp>

#include <iojudge/logging.hpp>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>

#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace iojudge {

namespace {

bool is_executable_file(const std::string& path) {
    struct ::stat buffer{};
    return ::stat(path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

std::vector<std::string> search_dirs() {
    const char* path = std::getenv("PATH");

    if (path == nullptr) {
        return {"/usr/local/bin", "/usr/bin", "/bin"};
    }

    return std::string_view{path} | ranges::views::split(':') |
           ranges::views::transform([](auto&& dir) { return dir | ranges::to<std::string>(); }) |
           ranges::to<std::vector>();
}

} // namespace

std::optional<std::string> which(const std::string& cmd) {
    static std::mutex cache_mutex;
    static std::unordered_map<std::string, std::optional<std::string>> cmd_cache;
    static const std::vector<std::string> dirs = search_dirs();

    if (cmd.find('/') != std::string::npos) {
        return is_executable_file(cmd) ? std::optional{cmd} : std::nullopt;
    }

    std::lock_guard lock{cache_mutex};

    if (auto iter = cmd_cache.find(cmd); iter != cmd_cache.end()) {
        return iter->second;
    }

    for (const std::string& dir : dirs) {
        if (dir.empty()) {
            continue;
        }

        std::string fullpath = (std::filesystem::path{dir} / cmd).string();

        if (is_executable_file(fullpath)) {
            LOG_TRACE("which({}) -> {}", cmd, fullpath);
            return cmd_cache[cmd] = fullpath;
        }
    }

    LOG_DEBUG("which({}): not found in PATH", cmd);
    return cmd_cache[cmd] = std::nullopt;
}

} // namespace iojudge
