#pragma once

#include <iojudge/build/build_manager.hpp>
#include <iojudge/common/class_traits.hpp>
#include <iojudge/common/formatters/enum.hpp>
#include <iojudge/execution/execution_manager.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace iojudge {

using BuildManagerFactory = std::function<std::unique_ptr<BuildManager>(std::string source)>;
using ExecutionManagerFactory =
    std::function<std::unique_ptr<ExecutionManager>(BuildArtifact artifact, ExecutionConfig config)>;

/// Everything needed to build and run programs of one language
struct LanguageRegistration
{
    std::string key;
    BuildManagerFactory make_build_manager;
    ExecutionManagerFactory make_execution_manager;
    std::vector<std::string> aliases{};

    /// Without the leading dot
    std::vector<std::string> extensions{};
};

enum class RegistrationMode {
    Overwrite, ///< Collisions replace the previous owner
    Strict,    ///< Collisions throw ConflictError
};

/// Maps language keys, aliases and file extensions to registrations
///
/// `add` might be better named `register` if not for the fact for it being
/// a reserved keyword.
///
/// Safe to use concurrently: any number of readers, one writer at a time.
class LanguageRegistry : NonMovable
{
public:
    LanguageRegistry() = default;

    /// The process-wide registry. Starts out empty
    static LanguageRegistry& get() noexcept;

    /// In Overwrite mode, aliases equal to another language's key are dropped with a warning,
    /// and a new key takes over an alias of the same name.
    void add(LanguageRegistration registration, RegistrationMode mode = RegistrationMode::Overwrite);

    /// Looks ``identifier`` up as a key, then as an alias, then as a file extension (with or without the dot).
    /// Throws UnknownLanguageError.
    LanguageRegistration resolve(std::string_view identifier) const;

    /// Resolves by the extension of ``path``. Throws UnknownLanguageError
    LanguageRegistration resolve_path(const std::filesystem::path& path) const;

    bool contains(std::string_view identifier) const;

    /// Sorted
    std::vector<std::string> get_language_keys() const;

    std::size_t get_num_registered() const;

private:
    /// Key owning `identifier`, if any. Caller must hold the lock
    const std::string* find_key(std::string_view identifier) const;

    void check_conflicts(const LanguageRegistration& registration) const;

    /// Removes ``name`` from the alias or extension list of its current owner
    void disown(std::map<std::string, std::string, std::less<>>& index, const std::string& name,
                std::vector<std::string> LanguageRegistration::*list);

    mutable std::shared_mutex mutex_;

    std::map<std::string, LanguageRegistration, std::less<>> registrations_;

    /// name -> key
    std::map<std::string, std::string, std::less<>> aliases_;
    std::map<std::string, std::string, std::less<>> extensions_;
};

} // namespace iojudge

FMT_SERIALIZE_ENUM(::iojudge::RegistrationMode, Overwrite, Strict);
