#include <placemerge/match/record_matcher.h>
#include <placemerge/match/token_similarity.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <map>
#include <mutex>
#include <thread>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace placemerge::match {

namespace {

struct Partition {
    std::vector<const PlaceRecord*> eligible; // sorted by record_id
    std::vector<ExcludedRecord> excluded;
};

Partition partitionSide(const std::vector<PlaceRecord>& records, Provider expected) {
    Partition out;

    // Only records that belong to this side can collide
    std::unordered_map<std::string, std::size_t> idCounts;
    for (const auto& r : records) {
        if (r.provider == expected)
            ++idCounts[r.record_id];
    }

    for (const auto& r : records) {
        if (r.provider != expected) {
            out.excluded.push_back({r.record_id, r.provider, ExclusionReason::ProviderMismatch});
            continue;
        }
        // Every copy of a duplicated id is dropped so the outcome cannot depend on order
        if (idCounts[r.record_id] > 1) {
            out.excluded.push_back({r.record_id, r.provider, ExclusionReason::DuplicateRecordId});
            continue;
        }
        const bool noName = r.normalized(AttributeKind::Name).empty();
        const bool noAddress = r.normalized(AttributeKind::Address).empty();
        if (noName || noAddress) {
            ExclusionReason reason = noName && noAddress ? ExclusionReason::MissingNameAndAddress
                                     : noName            ? ExclusionReason::MissingName
                                                         : ExclusionReason::MissingAddress;
            out.excluded.push_back({r.record_id, r.provider, reason});
            spdlog::debug("Excluding {} record '{}': {}", providerName(r.provider), r.record_id,
                          exclusionReasonName(reason));
            continue;
        }
        out.eligible.push_back(&r);
    }

    std::sort(out.eligible.begin(), out.eligible.end(),
              [](const PlaceRecord* a, const PlaceRecord* b) { return a->record_id < b->record_id; });
    std::sort(out.excluded.begin(), out.excluded.end(),
              [](const ExcludedRecord& a, const ExcludedRecord& b) {
                  return std::tie(a.record_id, a.reason) < std::tie(b.record_id, b.reason);
              });

    const auto duplicates = std::count_if(
        out.excluded.begin(), out.excluded.end(),
        [](const ExcludedRecord& e) { return e.reason == ExclusionReason::DuplicateRecordId; });
    if (duplicates > 0) {
        spdlog::warn("{}: {} records share a record_id and were excluded", providerName(expected),
                     duplicates);
    }
    return out;
}

std::vector<std::string> idsOf(const std::vector<const PlaceRecord*>& records) {
    std::vector<std::string> ids;
    ids.reserve(records.size());
    for (const auto* r : records) {
        ids.push_back(r->record_id);
    }
    return ids;
}

} // namespace

const char* blockingStrategyName(BlockingStrategy strategy) {
    switch (strategy) {
        case BlockingStrategy::None: return "none";
        case BlockingStrategy::PostalCode: return "postal_code";
        case BlockingStrategy::NameToken: return "name_token";
    }
    return "none";
}

std::optional<BlockingStrategy> parseBlockingStrategy(std::string_view text) {
    if (text == "none")
        return BlockingStrategy::None;
    if (text == "postal_code" || text == "postal")
        return BlockingStrategy::PostalCode;
    if (text == "name_token" || text == "name")
        return BlockingStrategy::NameToken;
    return std::nullopt;
}

const char* exclusionReasonName(ExclusionReason reason) {
    switch (reason) {
        case ExclusionReason::MissingName: return "missing_name";
        case ExclusionReason::MissingAddress: return "missing_address";
        case ExclusionReason::MissingNameAndAddress: return "missing_name_and_address";
        case ExclusionReason::DuplicateRecordId: return "duplicate_record_id";
        case ExclusionReason::ProviderMismatch: return "provider_mismatch";
    }
    return "missing_name";
}

Result<void> MatcherConfig::validate() const {
    if (!(similarity_threshold >= 0.0 && similarity_threshold <= 100.0)) {
        return Error{ErrorCode::InvalidArgument,
                     "similarity_threshold must be within [0, 100]"};
    }
    if (progress_interval == 0) {
        return Error{ErrorCode::InvalidArgument, "progress_interval must be positive"};
    }
    return {};
}

RecordMatcher::RecordMatcher(MatcherConfig config) : config_(std::move(config)) {}

std::string RecordMatcher::blockingKey(const PlaceRecord& record, BlockingStrategy strategy) {
    switch (strategy) {
        case BlockingStrategy::None:
            return "*";
        case BlockingStrategy::NameToken: {
            const auto& name = record.normalized(AttributeKind::Name);
            return name.substr(0, name.find(' '));
        }
        case BlockingStrategy::PostalCode: {
            const auto& address = record.normalized(AttributeKind::Address);
            // Scan tokens right to left for the first 5-digit token
            size_t end = address.size();
            while (end > 0) {
                size_t start = address.rfind(' ', end - 1);
                start = (start == std::string::npos) ? 0 : start + 1;
                std::string_view token(address.data() + start, end - start);
                if (token.size() == 5 &&
                    std::all_of(token.begin(), token.end(),
                                [](unsigned char c) { return std::isdigit(c); })) {
                    return std::string(token);
                }
                if (start == 0)
                    break;
                end = start - 1;
            }
            return {};
        }
    }
    return {};
}

std::vector<RecordMatcher::WorkUnit>
RecordMatcher::buildWorkUnits(const std::vector<const PlaceRecord*>& as,
                              const std::vector<const PlaceRecord*>& bs,
                              const std::vector<std::size_t>& remainingA,
                              const std::vector<std::size_t>& remainingB) const {
    std::vector<WorkUnit> units;
    if (remainingA.empty() || remainingB.empty())
        return units;

    if (config_.blocking == BlockingStrategy::None) {
        units.push_back({remainingA, remainingB});
        return units;
    }

    std::map<std::string, WorkUnit> buckets;
    std::vector<std::size_t> keylessA;
    std::vector<std::size_t> keylessB;
    for (auto ia : remainingA) {
        auto key = blockingKey(*as[ia], config_.blocking);
        if (key.empty())
            keylessA.push_back(ia);
        else
            buckets[key].as.push_back(ia);
    }
    for (auto ib : remainingB) {
        auto key = blockingKey(*bs[ib], config_.blocking);
        if (key.empty())
            keylessB.push_back(ib);
        else
            buckets[key].bs.push_back(ib);
    }

    // Keyed A records see their own bucket plus keyless B records; keyless A records see
    // every B record. Each (A, B) pair lands in exactly one unit.
    for (auto& [key, bucket] : buckets) {
        if (bucket.as.empty())
            continue;
        WorkUnit unit;
        unit.as = std::move(bucket.as);
        unit.bs = std::move(bucket.bs);
        unit.bs.insert(unit.bs.end(), keylessB.begin(), keylessB.end());
        if (!unit.bs.empty())
            units.push_back(std::move(unit));
    }
    if (!keylessA.empty()) {
        units.push_back({std::move(keylessA), remainingB});
    }
    return units;
}

std::vector<FuzzyCandidate>
RecordMatcher::scoreUnit(const WorkUnit& unit, const std::vector<const PlaceRecord*>& as,
                         const std::vector<const PlaceRecord*>& bs) const {
    std::vector<FuzzyCandidate> found;
    const double threshold = config_.similarity_threshold;
    for (auto ia : unit.as) {
        const auto& nameA = as[ia]->normalized(AttributeKind::Name);
        const auto& addressA = as[ia]->normalized(AttributeKind::Address);
        for (auto ib : unit.bs) {
            const double nameSim = tokenSetRatio(nameA, bs[ib]->normalized(AttributeKind::Name));
            if (nameSim < threshold)
                continue;
            const double addressSim =
                tokenSetRatio(addressA, bs[ib]->normalized(AttributeKind::Address));
            if (addressSim < threshold)
                continue;
            found.push_back({ia, ib, nameSim, addressSim});
        }
    }
    return found;
}

std::vector<std::vector<FuzzyCandidate>>
RecordMatcher::scoreUnits(const std::vector<WorkUnit>& units,
                          const std::vector<const PlaceRecord*>& as,
                          const std::vector<const PlaceRecord*>& bs) const {
    std::vector<std::vector<FuzzyCandidate>> results(units.size());
    if (units.empty())
        return results;

    std::size_t workers = config_.workers;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    workers = std::min(workers, units.size());

    std::atomic<std::size_t> done{0};
    std::mutex progressMutex;
    auto reportProgress = [&]() {
        const auto completed = done.fetch_add(1, std::memory_order_relaxed) + 1;
        if (completed % config_.progress_interval == 0 || completed == units.size()) {
            std::lock_guard<std::mutex> lock(progressMutex);
            spdlog::info("Fuzzy matching: {}/{} buckets scored", completed, units.size());
            if (progress_)
                progress_(completed, units.size());
        }
    };

    if (workers <= 1) {
        for (std::size_t i = 0; i < units.size(); ++i) {
            results[i] = scoreUnit(units[i], as, bs);
            reportProgress();
        }
        return results;
    }

    // Units share no mutable state; each writes only its own result slot
    boost::asio::thread_pool pool(workers);
    for (std::size_t i = 0; i < units.size(); ++i) {
        boost::asio::post(pool, [this, i, &units, &as, &bs, &results, &reportProgress]() {
            results[i] = scoreUnit(units[i], as, bs);
            reportProgress();
        });
    }
    pool.join();
    return results;
}

std::vector<FuzzyCandidate> RecordMatcher::assignGreedy(std::vector<FuzzyCandidate> candidates,
                                                        const std::vector<std::string>& idsA,
                                                        const std::vector<std::string>& idsB,
                                                        std::size_t* rejected) {
    std::sort(candidates.begin(), candidates.end(),
              [&](const FuzzyCandidate& x, const FuzzyCandidate& y) {
                  const double tx = x.total();
                  const double ty = y.total();
                  if (tx != ty)
                      return tx > ty;
                  const auto& ax = idsA[x.indexA];
                  const auto& ay = idsA[y.indexA];
                  if (ax != ay)
                      return ax < ay;
                  return idsB[x.indexB] < idsB[y.indexB];
              });

    std::vector<bool> usedA(idsA.size(), false);
    std::vector<bool> usedB(idsB.size(), false);
    std::vector<FuzzyCandidate> accepted;
    std::size_t skipped = 0;
    for (const auto& c : candidates) {
        if (usedA[c.indexA] || usedB[c.indexB]) {
            ++skipped;
            continue;
        }
        usedA[c.indexA] = true;
        usedB[c.indexB] = true;
        accepted.push_back(c);
    }
    if (rejected)
        *rejected = skipped;
    return accepted;
}

Result<MatchResult> RecordMatcher::match(const std::vector<PlaceRecord>& providerA,
                                         const std::vector<PlaceRecord>& providerB) const {
    if (auto valid = config_.validate(); !valid) {
        return valid.error();
    }

    MatchResult result;
    auto sideA = partitionSide(providerA, Provider::ProviderA);
    auto sideB = partitionSide(providerB, Provider::ProviderB);
    result.excluded = std::move(sideA.excluded);
    result.excluded.insert(result.excluded.end(), sideB.excluded.begin(), sideB.excluded.end());

    const auto& as = sideA.eligible;
    const auto& bs = sideB.eligible;
    result.stats.eligible_a = as.size();
    result.stats.eligible_b = bs.size();

    std::vector<bool> consumedA(as.size(), false);
    std::vector<bool> consumedB(bs.size(), false);

    // Exact stage
    struct Group {
        std::vector<std::size_t> as;
        std::vector<std::size_t> bs;
    };
    std::map<std::pair<std::string, std::string>, Group> groups;
    for (std::size_t i = 0; i < as.size(); ++i) {
        groups[{as[i]->normalized(AttributeKind::Name), as[i]->normalized(AttributeKind::Address)}]
            .as.push_back(i);
    }
    for (std::size_t i = 0; i < bs.size(); ++i) {
        groups[{bs[i]->normalized(AttributeKind::Name), bs[i]->normalized(AttributeKind::Address)}]
            .bs.push_back(i);
    }
    for (const auto& [key, group] : groups) {
        if (group.as.size() != 1 || group.bs.size() != 1)
            continue;
        MatchedPair pair;
        pair.recordA = *as[group.as.front()];
        pair.recordB = *bs[group.bs.front()];
        pair.match_kind = MatchKind::Exact;
        consumedA[group.as.front()] = true;
        consumedB[group.bs.front()] = true;
        result.pairs.push_back(std::move(pair));
    }
    result.stats.exact_pairs = result.pairs.size();

    // Fuzzy stage
    std::vector<std::size_t> remainingA;
    std::vector<std::size_t> remainingB;
    for (std::size_t i = 0; i < as.size(); ++i) {
        if (!consumedA[i])
            remainingA.push_back(i);
    }
    for (std::size_t i = 0; i < bs.size(); ++i) {
        if (!consumedB[i])
            remainingB.push_back(i);
    }

    const auto units = buildWorkUnits(as, bs, remainingA, remainingB);
    result.stats.buckets = units.size();
    for (const auto& unit : units) {
        result.stats.comparisons += unit.as.size() * unit.bs.size();
    }

    auto scored = scoreUnits(units, as, bs);
    std::vector<FuzzyCandidate> candidates;
    for (auto& local : scored) {
        candidates.insert(candidates.end(), local.begin(), local.end());
    }
    result.stats.fuzzy_candidates = candidates.size();

    const auto accepted = assignGreedy(std::move(candidates), idsOf(as), idsOf(bs),
                                       &result.stats.rejected_ambiguous);
    for (const auto& c : accepted) {
        MatchedPair pair;
        pair.recordA = *as[c.indexA];
        pair.recordB = *bs[c.indexB];
        pair.match_kind = MatchKind::Fuzzy;
        pair.name_similarity = c.name_similarity;
        pair.address_similarity = c.address_similarity;
        consumedA[c.indexA] = true;
        consumedB[c.indexB] = true;
        result.pairs.push_back(std::move(pair));
    }
    result.stats.fuzzy_pairs = accepted.size();

    std::sort(result.pairs.begin(), result.pairs.end(),
              [](const MatchedPair& x, const MatchedPair& y) {
                  return std::tie(x.recordA.record_id, x.recordB.record_id) <
                         std::tie(y.recordA.record_id, y.recordB.record_id);
              });

    for (std::size_t i = 0; i < as.size(); ++i) {
        if (!consumedA[i])
            result.unmatched.push_back({as[i]->record_id, Provider::ProviderA});
    }
    for (std::size_t i = 0; i < bs.size(); ++i) {
        if (!consumedB[i])
            result.unmatched.push_back({bs[i]->record_id, Provider::ProviderB});
    }

    spdlog::info("Matched {} exact + {} fuzzy pairs ({} candidates, {} rejected as ambiguous, "
                 "{} comparisons in {} buckets); {} excluded, {} unmatched",
                 result.stats.exact_pairs, result.stats.fuzzy_pairs,
                 result.stats.fuzzy_candidates, result.stats.rejected_ambiguous,
                 result.stats.comparisons, result.stats.buckets, result.excluded.size(),
                 result.unmatched.size());
    return result;
}

} // namespace placemerge::match
