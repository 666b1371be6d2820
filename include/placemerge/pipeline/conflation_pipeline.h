#pragma once

#include <vector>
#include <placemerge/config/conflation_config.h>
#include <placemerge/core/place.h>
#include <placemerge/core/types.h>
#include <placemerge/match/record_matcher.h>
#include <placemerge/normalize/text_normalizer.h>
#include <placemerge/resolve/conflation_resolver.h>

namespace placemerge::pipeline {

struct PipelineResult {
    match::MatchResult match;
    resolve::ResolutionOutput resolution;
};

/**
 * @brief normalize -> match -> resolve over two provider record sets.
 *
 * Records are normalized with the configured reference tables before matching, so callers
 * pass them as ingested. Fails only on invalid configuration.
 */
class ConflationPipeline {
public:
    explicit ConflationPipeline(config::ConflationConfig config);

    void setProgressCallback(match::ProgressCallback callback) {
        progress_ = std::move(callback);
    }

    Result<PipelineResult> run(std::vector<PlaceRecord> providerA,
                               std::vector<PlaceRecord> providerB) const;

    const config::ConflationConfig& config() const { return config_; }

private:
    config::ConflationConfig config_;
    match::ProgressCallback progress_;
};

} // namespace placemerge::pipeline
