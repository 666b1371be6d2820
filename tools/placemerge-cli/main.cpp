#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <placemerge/cli/placemerge_cli.h>

int main(int argc, char* argv[]) {
    try {
        // stdout carries the run document; logs go to stderr
        spdlog::set_default_logger(spdlog::stderr_color_mt("placemerge"));
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        placemerge::cli::PlacemergeCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
