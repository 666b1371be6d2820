#include <spdlog/spdlog.h>
#include <iostream>
#include <placemerge/cli/command.h>
#include <placemerge/cli/placemerge_cli.h>
#include <placemerge/io/place_reader.h>
#include <placemerge/io/result_json.h>
#include <placemerge/match/record_matcher.h>
#include <placemerge/pipeline/conflation_pipeline.h>

namespace placemerge::cli {

class ResolveCommand : public ICommand {
public:
    std::string getName() const override { return "resolve"; }

    std::string getDescription() const override {
        return "Match provider records and resolve one value per attribute";
    }

    void registerCommand(CLI::App& app, PlacemergeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("resolve", getDescription());
        cmd->add_option("--provider-a", providerA_, "Provider A records (JSON Lines)")
            ->type_name("PATH")
            ->required();
        cmd->add_option("--provider-b", providerB_, "Provider B records (JSON Lines)")
            ->type_name("PATH")
            ->required();
        cmd->add_option("-o,--output", output_, "Write the run document here instead of stdout")
            ->type_name("PATH");
        workersOpt_ = cmd->add_option("--workers", workers_,
                                      "Fuzzy matching threads (0 = hardware concurrency)");
        cmd->add_option("--blocking", blocking_, "none|postal_code|name_token")
            ->check(CLI::IsMember({"none", "postal_code", "name_token"}));

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto config = cli_->loadConfig();
        if (!config)
            return config.error();
        auto effective = std::move(config).value();

        if (workersOpt_ && workersOpt_->count() > 0)
            effective.matcher.workers = workers_;
        if (!blocking_.empty()) {
            auto strategy = match::parseBlockingStrategy(blocking_);
            if (!strategy) {
                return Error{ErrorCode::InvalidArgument, "Unknown blocking strategy: " + blocking_};
            }
            effective.matcher.blocking = *strategy;
        }

        auto recordsA = io::readPlaceRecords(providerA_, Provider::ProviderA);
        if (!recordsA)
            return recordsA.error();
        auto recordsB = io::readPlaceRecords(providerB_, Provider::ProviderB);
        if (!recordsB)
            return recordsB.error();

        pipeline::ConflationPipeline pipeline(std::move(effective));
        auto run = pipeline.run(std::move(recordsA.value().records),
                                std::move(recordsB.value().records));
        if (!run)
            return run.error();

        const auto doc = io::buildRunDocument(run.value().match, run.value().resolution);
        if (output_.empty()) {
            io::writeJson(doc, std::cout);
            if (!std::cout)
                return Error{ErrorCode::WriteError, "Failed writing to stdout"};
            return {};
        }
        return io::writeJsonFile(doc, output_);
    }

private:
    PlacemergeCLI* cli_ = nullptr;
    std::string providerA_;
    std::string providerB_;
    std::string output_;
    std::size_t workers_ = 0;
    CLI::Option* workersOpt_ = nullptr;
    std::string blocking_;
};

std::unique_ptr<ICommand> createResolveCommand() {
    return std::make_unique<ResolveCommand>();
}

} // namespace placemerge::cli
