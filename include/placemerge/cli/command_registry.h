#pragma once

#include <memory>
#include <placemerge/cli/command.h>

namespace placemerge::cli {

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    static void registerAllCommands(PlacemergeCLI* cli);

    static std::unique_ptr<ICommand> createResolveCommand();
    static std::unique_ptr<ICommand> createEvaluateCommand();
};

} // namespace placemerge::cli
