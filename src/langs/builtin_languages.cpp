#include <iojudge/langs/builtin_languages.hpp>

#include <iojudge/build/build_manager.hpp>
#include <iojudge/execution/execution_manager.hpp>
#include <iojudge/logging.hpp>
#include <iojudge/registrars/language_registry.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace iojudge {

namespace {

CompiledLanguageConfig c_family(std::string compiler, std::string extension, std::vector<std::string> extra_flags) {
    Command build{compiler};
    build.insert(build.end(), extra_flags.begin(), extra_flags.end());
    build.insert(build.end(), {"-o", "{executable}", "{source}", "-lm"});

    Command check{compiler, "-fsyntax-only"};
    check.insert(check.end(), extra_flags.begin(), extra_flags.end());
    check.emplace_back("{source}");

    return {.source_extension = std::move(extension),
            .build_command = std::move(build),
            .syntax_check_command = std::move(check)};
}

} // namespace

LanguageRegistration compiled_language(std::string key, CompiledLanguageConfig config,
                                       std::vector<std::string> aliases, std::vector<std::string> extensions) {
    auto make_build_manager = [key, config](std::string source) -> std::unique_ptr<BuildManager> {
        return std::make_unique<CompiledLanguageBuildManager>(std::move(source), key, config);
    };

    auto make_execution_manager = [](BuildArtifact artifact,
                                     ExecutionConfig exec_config) -> std::unique_ptr<ExecutionManager> {
        return std::make_unique<CompiledLanguageExecutionManager>(std::move(artifact), std::move(exec_config));
    };

    return {.key = std::move(key),
            .make_build_manager = std::move(make_build_manager),
            .make_execution_manager = std::move(make_execution_manager),
            .aliases = std::move(aliases),
            .extensions = std::move(extensions)};
}

LanguageRegistration interpreted_language(std::string key, InterpretedLanguageConfig config,
                                          std::vector<std::string> aliases, std::vector<std::string> extensions) {
    auto make_build_manager = [key, config](std::string source) -> std::unique_ptr<BuildManager> {
        return std::make_unique<InterpretedLanguageBuildManager>(std::move(source), key, config);
    };

    auto make_execution_manager = [interpreter = config.interpreter_command](
                                      BuildArtifact artifact,
                                      ExecutionConfig exec_config) -> std::unique_ptr<ExecutionManager> {
        return std::make_unique<InterpretedLanguageExecutionManager>(std::move(artifact), std::move(exec_config),
                                                                     interpreter);
    };

    return {.key = std::move(key),
            .make_build_manager = std::move(make_build_manager),
            .make_execution_manager = std::move(make_execution_manager),
            .aliases = std::move(aliases),
            .extensions = std::move(extensions)};
}

void register_builtin_languages(LanguageRegistry& registry) {
    // C
    registry.add(compiled_language("c", c_family("gcc", "c", {"-O2"}), {"gcc", "C", "cc"}, {"c"}));
    registry.add(compiled_language("clang", c_family("clang", "c", {"-O2"})));
    registry.add(compiled_language("tcc", {.source_extension = "c",
                                           .build_command = {"tcc", "-o", "{executable}", "{source}", "-lm"},
                                           .syntax_check_command = {"tcc", "-c", "-o", "/dev/null", "{source}"}}));

    // C++
    registry.add(compiled_language("c++", c_family("g++", "cpp", {"-std=c++17", "-O2"}), {"cpp", "g++", "C++"},
                                   {"cpp", "c++", "cxx"}));
    registry.add(compiled_language("clang++", c_family("clang++", "cpp", {"-std=c++17", "-O2"})));

    // Python
    registry.add(interpreted_language("python",
                                      {.source_extension = "py",
                                       .interpreter_command = {"python3", "-u", "{source}"},
                                       .syntax_check_command = {"python3", "-m", "py_compile", "{source}"}},
                                      {"python3", "py", "py3"}, {"py", "py3"}));
    registry.add(interpreted_language("python2",
                                      {.source_extension = "py",
                                       .interpreter_command = {"python2", "-u", "{source}"},
                                       .syntax_check_command = {"python2", "-m", "py_compile", "{source}"}},
                                      {"python27", "py2"}, {"py2"}));

    // Ruby
    registry.add(interpreted_language("ruby",
                                      {.source_extension = "rb",
                                       .interpreter_command = {"ruby", "{source}"},
                                       .syntax_check_command = {"ruby", "-c", "{source}"}},
                                      {"rb"}, {"rb"}));

    // Shell
    registry.add(interpreted_language("sh",
                                      {.source_extension = "sh",
                                       .interpreter_command = {"sh", "{source}"},
                                       .syntax_check_command = {"sh", "-n", "{source}"}},
                                      {"shell"}, {"sh"}));
    registry.add(interpreted_language("bash",
                                      {.source_extension = "bash",
                                       .interpreter_command = {"bash", "{source}"},
                                       .syntax_check_command = {"bash", "-n", "{source}"}},
                                      {}, {"bash"}));

    LOG_DEBUG("Registered {} builtin languages", registry.get_num_registered());
}

} // namespace iojudge
