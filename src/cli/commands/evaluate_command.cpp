#include <spdlog/spdlog.h>
#include <iostream>
#include <placemerge/cli/command.h>
#include <placemerge/cli/placemerge_cli.h>
#include <placemerge/eval/accuracy_evaluator.h>
#include <placemerge/io/result_json.h>

namespace placemerge::cli {

class EvaluateCommand : public ICommand {
public:
    std::string getName() const override { return "evaluate"; }

    std::string getDescription() const override {
        return "Score resolved values against hand-labelled truth";
    }

    void registerCommand(CLI::App& app, PlacemergeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("evaluate", getDescription());
        cmd->add_option("--truth", truth_, "Truth labels (JSON Lines with place_id, truth_*)")
            ->type_name("PATH")
            ->required();
        cmd->add_option("--predictions", predictions_, "Run document written by resolve")
            ->type_name("PATH")
            ->required();
        cmd->add_option("--min-similarity", minSimilarity_,
                        "Indel similarity counted as a match (0..100)")
            ->check(CLI::Range(0.0, 100.0));

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto config = cli_->loadConfig();
        if (!config)
            return config.error();

        auto truth = eval::readTruth(truth_);
        if (!truth)
            return truth.error();
        auto predictions = io::readPredictions(predictions_);
        if (!predictions)
            return predictions.error();

        eval::AccuracyEvaluator evaluator(config.value().tables, minSimilarity_);
        const auto report = evaluator.evaluate(truth.value(), predictions.value());
        spdlog::info("Evaluated {} truth rows against {} predicted places", report.truth_rows,
                     predictions.value().size());
        std::cout << eval::formatReport(report);
        return {};
    }

private:
    PlacemergeCLI* cli_ = nullptr;
    std::string truth_;
    std::string predictions_;
    double minSimilarity_ = 90.0;
};

std::unique_ptr<ICommand> createEvaluateCommand() {
    return std::make_unique<EvaluateCommand>();
}

} // namespace placemerge::cli
