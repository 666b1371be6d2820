#include <placemerge/cli/command_registry.h>
#include <placemerge/cli/placemerge_cli.h>

#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <placemerge/config/config_helpers.h>

namespace placemerge::cli {

PlacemergeCLI::PlacemergeCLI() {
    app_ = std::make_unique<CLI::App>("Match and conflate place records from two providers",
                                      "placemerge");
    app_->require_subcommand(1);
    // Global options may follow the subcommand
    app_->fallthrough();

    app_->add_option("--config", configPath_, "Configuration file (TOML)")->type_name("PATH");
    app_->add_option("--log-level", logLevel_, "trace|debug|info|warn|error")
        ->type_name("LEVEL")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning", "error", "off"}));

    CommandRegistry::registerAllCommands(this);
}

PlacemergeCLI::~PlacemergeCLI() = default;

void PlacemergeCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

std::optional<spdlog::level::level_enum> PlacemergeCLI::parseLogLevel(const std::string& text) {
    std::string v;
    v.reserve(text.size());
    for (char c : text)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "off")
        return spdlog::level::off;
    return std::nullopt;
}

void PlacemergeCLI::applyLogLevel() const {
    // Precedence: --log-level > PLACEMERGE_LOG_LEVEL > info
    if (auto lvl = parseLogLevel(logLevel_)) {
        spdlog::set_level(*lvl);
        return;
    }
    if (const char* envLvl = std::getenv("PLACEMERGE_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLogLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Ignoring unknown PLACEMERGE_LOG_LEVEL '{}'", envLvl);
    }
    spdlog::set_level(spdlog::level::info);
}

Result<config::ConflationConfig> PlacemergeCLI::loadConfig() const {
    const char* envConfig = std::getenv("PLACEMERGE_CONFIG");
    const bool named = !configPath_.empty() || (envConfig && *envConfig);
    const auto path = config::get_config_path(configPath_);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (named) {
            return Error{ErrorCode::FileNotFound, "Config file not found: " + path.string()};
        }
        spdlog::debug("No config at {}, using built-in defaults", path.string());
        return config::conflationConfigFromToml({});
    }
    return config::loadConflationConfig(path);
}

int PlacemergeCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    applyLogLevel();

    if (!pendingCommand_) {
        spdlog::error("No command given");
        return 1;
    }
    auto result = pendingCommand_->execute();
    if (!result) {
        spdlog::error("{} failed: {} ({})", pendingCommand_->getName(), result.error().message,
                      result.error().code);
        return 1;
    }
    return 0;
}

} // namespace placemerge::cli
