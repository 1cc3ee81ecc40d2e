#include <iojudge/registrars/language_registry.hpp>

#include <iojudge/exceptions.hpp>
#include <iojudge/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <libassert/assert.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace iojudge {

namespace {

std::string_view strip_dot(std::string_view extension) {
    if (extension.starts_with('.')) {
        extension.remove_prefix(1);
    }
    return extension;
}

} // namespace

LanguageRegistry& LanguageRegistry::get() noexcept {
    // thread-safe singleton initialization pattern
    static LanguageRegistry local_instance{};

    return local_instance;
}

void LanguageRegistry::add(LanguageRegistration registration, RegistrationMode mode) {
    ASSERT(!registration.key.empty(), "language key must not be empty");
    ASSERT(registration.make_build_manager && registration.make_execution_manager,
           "both manager factories are required", registration.key);

    for (std::string& extension : registration.extensions) {
        extension = std::string{strip_dot(extension)};
    }

    std::unique_lock lock{mutex_};

    if (mode == RegistrationMode::Strict) {
        check_conflicts(registration);
    }

    const std::string key = registration.key;

    // Keys are looked up before aliases, so an alias naming another language's key could never resolve
    std::erase_if(registration.aliases, [this, &key](const std::string& alias) {
        if (alias == key || !registrations_.contains(alias)) {
            return false;
        }
        LOG_WARN("Ignoring alias {:?} of language {:?}: it is the key of another language", alias, key);
        return true;
    });

    // Re-registering a key replaces the previous registration entirely
    std::erase_if(aliases_, [&key](const auto& entry) { return entry.second == key; });
    std::erase_if(extensions_, [&key](const auto& entry) { return entry.second == key; });

    // A new key shadows an alias of the same name
    disown(aliases_, key, &LanguageRegistration::aliases);
    aliases_.erase(key);

    for (const std::string& alias : registration.aliases) {
        disown(aliases_, alias, &LanguageRegistration::aliases);
        aliases_.insert_or_assign(alias, key);
    }

    for (const std::string& extension : registration.extensions) {
        disown(extensions_, extension, &LanguageRegistration::extensions);
        extensions_.insert_or_assign(extension, key);
    }

    LOG_DEBUG("Registered language {:?} (aliases: {}, extensions: {})", key, registration.aliases,
              registration.extensions);

    registrations_.insert_or_assign(key, std::move(registration));
}

void LanguageRegistry::check_conflicts(const LanguageRegistration& registration) const {
    auto is_taken = [this](std::string_view name) { return registrations_.contains(name) || aliases_.contains(name); };

    if (is_taken(registration.key)) {
        throw ConflictError{fmt::format("language {:?} is already registered", registration.key)};
    }

    for (const std::string& alias : registration.aliases) {
        if (is_taken(alias)) {
            throw ConflictError{fmt::format("alias {:?} of language {:?} is already registered", alias,
                                            registration.key)};
        }
    }

    for (const std::string& extension : registration.extensions) {
        if (auto iter = extensions_.find(extension); iter != extensions_.end()) {
            throw ConflictError{fmt::format("extension {:?} of language {:?} is already claimed by {:?}", extension,
                                            registration.key, iter->second)};
        }
    }
}

void LanguageRegistry::disown(std::map<std::string, std::string, std::less<>>& index, const std::string& name,
                              std::vector<std::string> LanguageRegistration::*list) {
    auto iter = index.find(name);

    if (iter == index.end()) {
        return;
    }

    if (auto owner = registrations_.find(iter->second); owner != registrations_.end()) {
        LOG_DEBUG("{:?} moves away from language {:?}", name, owner->first);
        std::erase(owner->second.*list, name);
    }
}

const std::string* LanguageRegistry::find_key(std::string_view identifier) const {
    if (auto iter = registrations_.find(identifier); iter != registrations_.end()) {
        return &iter->first;
    }

    if (auto iter = aliases_.find(identifier); iter != aliases_.end()) {
        return &iter->second;
    }

    if (auto iter = extensions_.find(strip_dot(identifier)); iter != extensions_.end()) {
        return &iter->second;
    }

    return nullptr;
}

LanguageRegistration LanguageRegistry::resolve(std::string_view identifier) const {
    std::shared_lock lock{mutex_};

    if (const std::string* key = find_key(identifier)) {
        return registrations_.find(*key)->second;
    }

    throw UnknownLanguageError{std::string{identifier}};
}

LanguageRegistration LanguageRegistry::resolve_path(const std::filesystem::path& path) const {
    // A path without an extension is looked up as ".", which is never registered
    std::string extension = path.has_extension() ? path.extension().string() : ".";

    std::shared_lock lock{mutex_};

    if (auto iter = extensions_.find(strip_dot(extension)); iter != extensions_.end()) {
        return registrations_.find(iter->second)->second;
    }

    throw UnknownLanguageError{path.string()};
}

bool LanguageRegistry::contains(std::string_view identifier) const {
    std::shared_lock lock{mutex_};

    return find_key(identifier) != nullptr;
}

std::vector<std::string> LanguageRegistry::get_language_keys() const {
    std::shared_lock lock{mutex_};

    std::vector<std::string> keys;
    keys.reserve(registrations_.size());

    for (const auto& [key, registration] : registrations_) {
        keys.push_back(key);
    }

    return keys;
}

std::size_t LanguageRegistry::get_num_registered() const {
    std::shared_lock lock{mutex_};

    return registrations_.size();
}

} // namespace iojudge
