#pragma once

#include <string>
#include <vector>

namespace iojudge {

/// A program and its arguments, argv[0] first
using Command = std::vector<std::string>;

/// Values substituted into command templates
struct CommandPaths
{
    std::string source;     ///< {source}
    std::string executable; ///< {executable}
    std::string workspace;  ///< {workspace}
};

/// Expands fmt-style named placeholders in every argument of ``templ``, e.g.
///   {"gcc", "{source}", "-o", "{executable}"}
/// Throws std::invalid_argument for malformed templates or unknown placeholders.
Command expand_command(const Command& templ, const CommandPaths& paths);

} // namespace iojudge
