#include <placemerge/cli/command_registry.h>
#include <placemerge/cli/placemerge_cli.h>

namespace placemerge::cli {

// Factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createResolveCommand();
std::unique_ptr<ICommand> createEvaluateCommand();

void CommandRegistry::registerAllCommands(PlacemergeCLI* cli) {
    cli->registerCommand(CommandRegistry::createResolveCommand());
    cli->registerCommand(CommandRegistry::createEvaluateCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createResolveCommand() {
    return ::placemerge::cli::createResolveCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createEvaluateCommand() {
    return ::placemerge::cli::createEvaluateCommand();
}

} // namespace placemerge::cli
