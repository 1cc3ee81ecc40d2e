#pragma once

#include <optional>
#include <string>

namespace iojudge {

/// Locates `cmd` in the directories listed by the PATH environment variable.
/// Commands containing a '/' are returned as-is if they name an executable file.
/// Lookups are cached for the lifetime of the process; safe to call concurrently.
std::optional<std::string> which(const std::string& cmd);

} // namespace iojudge
