#pragma once

#include <iojudge/build/build_manager.hpp>
#include <iojudge/registrars/language_registry.hpp>

#include <string>
#include <vector>

namespace iojudge {

/// A registration whose managers are the generic compiled-language variants configured by ``config``
LanguageRegistration compiled_language(std::string key, CompiledLanguageConfig config,
                                       std::vector<std::string> aliases = {},
                                       std::vector<std::string> extensions = {});

/// A registration whose managers are the generic interpreted-language variants configured by ``config``
LanguageRegistration interpreted_language(std::string key, InterpretedLanguageConfig config,
                                          std::vector<std::string> aliases = {},
                                          std::vector<std::string> extensions = {});

/// Registers C, C++, Python, Ruby and shell support through the public registration API.
/// Called once at startup; later registrations (e.g. plugins) may override any of them.
void register_builtin_languages(LanguageRegistry& registry);

} // namespace iojudge
