#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <placemerge/cli/command.h>
#include <placemerge/config/conflation_config.h>

namespace placemerge::cli {

/**
 * Main CLI application class
 *
 * Owns the CLI11 app, the global --config and --log-level options and the registered
 * subcommands. Subcommands report failure through Result; run() turns that into exit code 1.
 */
class PlacemergeCLI {
public:
    PlacemergeCLI();
    ~PlacemergeCLI();

    int run(int argc, char* argv[]);

    void registerCommand(std::unique_ptr<ICommand> command);

    // Called from a subcommand callback; the command runs once logging is configured.
    void setPendingCommand(ICommand* command) { pendingCommand_ = command; }

    /**
     * Load the effective configuration.
     *
     * Order: --config, $PLACEMERGE_CONFIG, $XDG_CONFIG_HOME/placemerge/config.toml,
     * ~/.config/placemerge/config.toml. A missing file is an error only when it was named
     * explicitly; otherwise built-in defaults apply.
     */
    Result<config::ConflationConfig> loadConfig() const;

    const std::string& configOverride() const { return configPath_; }

    static std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& text);

private:
    void applyLogLevel() const;

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    std::string configPath_;
    std::string logLevel_;
    ICommand* pendingCommand_ = nullptr;
};

} // namespace placemerge::cli
