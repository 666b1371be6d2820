#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include <placemerge/core/types.h>

namespace placemerge::cli {

class PlacemergeCLI;

/**
 * Base interface for CLI subcommands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "resolve", "evaluate")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, PlacemergeCLI* cli) = 0;

    virtual Result<void> execute() = 0;
};

} // namespace placemerge::cli
