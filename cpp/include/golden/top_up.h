// Golden/cpp/include/golden/top_up.h
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "golden/collaborators.h"
#include "golden/config.h"
#include "golden/dedup.h"
#include "golden/errors.h"
#include "golden/item.h"
#include "golden/similarity.h"

namespace golden {

struct TopUpOptions {
    int quota{5};               // for strata present in the pool but not declared
    int max_attempts{2};
    int oversub_factor{5};
    uint64_t base_seed{DEFAULT_SEED};
    DedupOptions dedup;
};

// reason: top_up | not_needed | over_quota | pool_empty | regenerated |
//         rejected_by_validator | duplicate_id | synthesis_failed | band_mix
struct TopUpTraceEntry {
    std::string stratum;
    std::string candidate_id;
    std::optional<double> max_jaccard;
    std::optional<bool> selected;
    std::string reason;
    int attempt{0};             // 0 => not a regeneration entry
    std::string message;
};

struct TopUpResult {
    std::vector<Item> items;        // renumbered, stamped
    std::vector<TopUpTraceEntry> trace;
    std::vector<Item> regenerated;  // every validated regenerated candidate
    std::vector<std::string> band_mix_breaches; // strata off the 1/3/1 scheme
};

class QuotaUnmetError : public GoldenException {
public:
    QuotaUnmetError(StratumKey stratum, int have, int need, std::vector<TopUpTraceEntry> trace);

    const StratumKey& stratum() const { return stratum_; }
    int have() const { return have_; }
    int need() const { return need_; }
    const std::vector<TopUpTraceEntry>& trace() const { return trace_; }

private:
    StratumKey stratum_;
    int have_;
    int need_;
    std::vector<TopUpTraceEntry> trace_;
};

// Restores every stratum (declared + present in `pre_dedup`) to its quota.
//   pre_dedup : validated pool before dedup (top-up candidates come from here)
//   kept      : dedup survivors
//   synth     : may be null, regeneration then fails immediately
//   kits      : decides platform.server of regeneration slots, may be null
// Picks prefer bands the stratum still misses, then (max Jaccard, id).
// Throws QuotaUnmetError when a stratum stays short after max_attempts.
TopUpResult top_up(const std::vector<Item>& pre_dedup,
                   const std::vector<Item>& kept,
                   const std::vector<DeclaredStratum>& declared,
                   FingerprintCache& cache,
                   Synthesizer* synth,
                   const Validator* validator,
                   const KitTable* kits,
                   const TopUpOptions& opt);

// rep 1..n within stratum (by candidate_id), global seq over strata in key
// order, slot_id rebuilt, source_candidate_id stamped where empty.
std::vector<Item> renumber_strata(std::vector<Item> items);

nlohmann::json to_json(const std::vector<TopUpTraceEntry>& trace);

} // namespace golden
