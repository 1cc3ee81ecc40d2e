#include <iojudge/execution/execution_manager.hpp>

#include "execution/interaction_session.hpp"

#include <iojudge/common/command.hpp>
#include <iojudge/logging.hpp>

#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace iojudge {

ExecutionManager::ExecutionManager(BuildArtifact artifact, ExecutionConfig config)
    : artifact_{std::move(artifact)}
    , config_{std::move(config)} {}

ExecutionResult ExecutionManager::execute(const std::vector<std::string>& inputs, std::stop_token stop) {
    LOG_DEBUG("Executing {} program with {} input(s)", artifact_.language, inputs.size());

    InteractionSession session{get_command(), artifact_.workspace, config_, inputs, std::move(stop)};

    return session.run();
}

Command CompiledLanguageExecutionManager::get_command() const {
    return {get_artifact().entry_point.string()};
}

InterpretedLanguageExecutionManager::InterpretedLanguageExecutionManager(BuildArtifact artifact,
                                                                         ExecutionConfig config,
                                                                         Command interpreter_command)
    : ExecutionManager{std::move(artifact), std::move(config)}
    , interpreter_command_{std::move(interpreter_command)} {}

Command InterpretedLanguageExecutionManager::get_command() const {
    const BuildArtifact& artifact = get_artifact();

    return expand_command(interpreter_command_, {.source = artifact.entry_point.string(),
                                                 .executable = artifact.entry_point.string(),
                                                 .workspace = artifact.workspace.string()});
}

} // namespace iojudge
