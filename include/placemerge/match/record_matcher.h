#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <placemerge/core/place.h>
#include <placemerge/core/types.h>

namespace placemerge::match {

// How both sides are partitioned before fuzzy scoring.
enum class BlockingStrategy {
    None,       // score every A record against every B record
    PostalCode, // last 5-digit token of the normalized address
    NameToken   // first token of the normalized name
};

const char* blockingStrategyName(BlockingStrategy strategy);
std::optional<BlockingStrategy> parseBlockingStrategy(std::string_view text);

struct MatcherConfig {
    // Applied independently to name and address similarity, 0..100
    double similarity_threshold = 85.0;
    // Postal blocking only compares records whose postal keys agree (or that have none), so a
    // pair with a mistyped postal code is never scored. None restores the full scan.
    BlockingStrategy blocking = BlockingStrategy::PostalCode;
    // 0 = hardware concurrency, 1 = score on the calling thread
    std::size_t workers = 0;
    // Completed buckets between progress log lines
    std::size_t progress_interval = 64;

    Result<void> validate() const;
};

enum class ExclusionReason {
    MissingName,
    MissingAddress,
    MissingNameAndAddress,
    DuplicateRecordId,
    ProviderMismatch
};

const char* exclusionReasonName(ExclusionReason reason);

struct ExcludedRecord {
    std::string record_id;
    Provider provider = Provider::ProviderA;
    ExclusionReason reason = ExclusionReason::MissingName;
};

// Eligible record that found no counterpart in either stage.
struct UnmatchedRecord {
    std::string record_id;
    Provider provider = Provider::ProviderA;
};

struct FuzzyCandidate {
    std::size_t indexA = 0; // into the matcher's sorted eligible A list
    std::size_t indexB = 0;
    double name_similarity = 0.0;
    double address_similarity = 0.0;

    double total() const { return name_similarity + address_similarity; }
};

struct MatchStats {
    std::size_t eligible_a = 0;
    std::size_t eligible_b = 0;
    std::size_t exact_pairs = 0;
    std::size_t fuzzy_candidates = 0;
    std::size_t fuzzy_pairs = 0;
    std::size_t rejected_ambiguous = 0;
    std::size_t comparisons = 0;
    std::size_t buckets = 0;
};

struct MatchResult {
    // 1:1 pairs ordered by (recordA.record_id, recordB.record_id)
    std::vector<MatchedPair> pairs;
    std::vector<ExcludedRecord> excluded;
    std::vector<UnmatchedRecord> unmatched;
    MatchStats stats;
};

// Invoked from worker threads (serialized) as fuzzy buckets complete.
using ProgressCallback = std::function<void(std::size_t done, std::size_t total)>;

/**
 * @brief Pairs ProviderA and ProviderB records that describe the same place.
 *
 * Exact stage: records sharing (normalized name, normalized address) pair up when the group
 * holds exactly one record per side. Fuzzy stage: the remaining records are scored with
 * tokenSetRatio on name and address within blocking buckets; candidates reaching the
 * threshold on both are assigned greedily by descending total similarity, ties broken by
 * ascending (recordA.record_id, recordB.record_id). Input records must already carry
 * normalized attributes (TextNormalizer::normalizeRecord).
 *
 * The result does not depend on input order. Data defects never fail a run; they are
 * reported in MatchResult::excluded.
 */
class RecordMatcher {
public:
    explicit RecordMatcher(MatcherConfig config = {});

    void setProgressCallback(ProgressCallback callback) { progress_ = std::move(callback); }

    const MatcherConfig& config() const { return config_; }

    // Fails only when the configuration is invalid.
    Result<MatchResult> match(const std::vector<PlaceRecord>& providerA,
                              const std::vector<PlaceRecord>& providerB) const;

    // Empty when the record has no key under `strategy`.
    static std::string blockingKey(const PlaceRecord& record, BlockingStrategy strategy);

    /**
     * @brief Sequential greedy 1:1 assignment.
     *
     * Sorts `candidates` descending by total similarity, ties by ascending ids, and accepts
     * a candidate only when neither side is consumed. Returns accepted candidates in
     * acceptance order.
     */
    static std::vector<FuzzyCandidate>
    assignGreedy(std::vector<FuzzyCandidate> candidates, const std::vector<std::string>& idsA,
                 const std::vector<std::string>& idsB, std::size_t* rejected = nullptr);

private:
    struct WorkUnit {
        std::vector<std::size_t> as;
        std::vector<std::size_t> bs;
    };

    std::vector<WorkUnit> buildWorkUnits(const std::vector<const PlaceRecord*>& as,
                                         const std::vector<const PlaceRecord*>& bs,
                                         const std::vector<std::size_t>& remainingA,
                                         const std::vector<std::size_t>& remainingB) const;

    std::vector<FuzzyCandidate> scoreUnit(const WorkUnit& unit,
                                          const std::vector<const PlaceRecord*>& as,
                                          const std::vector<const PlaceRecord*>& bs) const;

    std::vector<std::vector<FuzzyCandidate>>
    scoreUnits(const std::vector<WorkUnit>& units, const std::vector<const PlaceRecord*>& as,
               const std::vector<const PlaceRecord*>& bs) const;

    MatcherConfig config_;
    ProgressCallback progress_;
};

} // namespace placemerge::match
