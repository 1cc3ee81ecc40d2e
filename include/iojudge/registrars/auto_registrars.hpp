#pragma once

#include <iojudge/registrars/language_registry.hpp>

#include <utility>

namespace iojudge {

/// Helper class that, when constructed, registers a language with the global registry.
/// Intended for plugins, as a namespace-scope object:
///
///   static const LanguageAutoRegistrar my_lang{interpreted_language("lua", {...})};
class LanguageAutoRegistrar
{
public:
    explicit LanguageAutoRegistrar(LanguageRegistration registration,
                                   RegistrationMode mode = RegistrationMode::Overwrite) {
        LanguageRegistry::get().add(std::move(registration), mode);
    }
};

} // namespace iojudge
