#include <placemerge/pipeline/conflation_pipeline.h>

#include <spdlog/spdlog.h>

namespace placemerge::pipeline {

ConflationPipeline::ConflationPipeline(config::ConflationConfig config)
    : config_(std::move(config)) {}

Result<PipelineResult> ConflationPipeline::run(std::vector<PlaceRecord> providerA,
                                               std::vector<PlaceRecord> providerB) const {
    if (auto valid = config_.validate(); !valid) {
        return valid.error();
    }

    normalize::TextNormalizer normalizer(config_.tables);
    for (auto& record : providerA) {
        record = normalizer.normalizeRecord(std::move(record));
    }
    for (auto& record : providerB) {
        record = normalizer.normalizeRecord(std::move(record));
    }
    spdlog::debug("Normalized {} {} and {} {} records", providerA.size(),
                  providerName(Provider::ProviderA), providerB.size(),
                  providerName(Provider::ProviderB));

    match::RecordMatcher matcher(config_.matcher);
    if (progress_)
        matcher.setProgressCallback(progress_);
    auto matched = matcher.match(providerA, providerB);
    if (!matched) {
        return matched.error();
    }

    PipelineResult result;
    result.match = std::move(matched).value();

    resolve::ConflationResolver resolver(config_.tables, config_.resolver);
    result.resolution = resolver.resolveAll(result.match.pairs);
    return result;
}

} // namespace placemerge::pipeline
