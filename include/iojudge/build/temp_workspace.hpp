#pragma once

#include <iojudge/common/class_traits.hpp>

#include <filesystem>
#include <string_view>

namespace iojudge {

/// Exclusively owned temporary directory, removed with everything in it on destruction
class TempWorkspace : NonCopyable
{
public:
    /// Creates a fresh directory "<tmp>/<prefix>-XXXXXX". Throws JudgeError on failure
    explicit TempWorkspace(std::string_view prefix = "iojudge");
    ~TempWorkspace();
    TempWorkspace(TempWorkspace&& other) noexcept;
    TempWorkspace& operator=(TempWorkspace&& rhs) noexcept;

    const std::filesystem::path& path() const { return path_; }

    /// Writes ``contents`` to ``relative`` (inside the workspace) and returns the absolute path.
    /// Throws JudgeError if the path would escape the workspace or the write fails.
    std::filesystem::path write_file(const std::filesystem::path& relative, std::string_view contents) const;

    /// Removes the directory now. Safe to call more than once
    void release() noexcept;

private:
    std::filesystem::path path_;
};

} // namespace iojudge
