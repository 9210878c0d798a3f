// Golden/cpp/include/golden/pipeline.h
#pragma once
#include <array>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "golden/collaborators.h"
#include "golden/config.h"
#include "golden/item.h"
#include "golden/splitter.h"

namespace golden {

struct PipelineSummary {
    size_t input{0};
    size_t validated{0};
    size_t rejected{0};
    size_t deduped{0};
    size_t topped{0};
    size_t swaps{0};
    size_t train{0};
    size_t val{0};
    size_t test{0};
    bool quota_ok{false};
    bool strata_band_mix_ok{false};   // every stratum 1/3/1 after top-up
    bool cluster_diverse{false};
    bool shannon_diverse{false};
    bool band_mix_ok{false};
    std::string splits_digest;
};

nlohmann::json to_json(const PipelineSummary& s);

// Final rows: id = slot_id, split set, candidate_id dropped,
// source_candidate_id ensured; every list sorted by id.
struct PackagedSplits {
    std::array<std::vector<nlohmann::json>, 3> splits; // train / val / test
    std::vector<nlohmann::json> all;
};

// PKG_ERR (ValidationFailed) when a split id is missing from `items` or an
// item is not covered by exactly one split.
PackagedSplits package_items(const std::vector<Item>& items, const SplitAssignment& a);

// Runs validate -> dedup -> top-up -> diversity -> bands -> split -> package
// and writes every artifact to out_dir. QuotaUnmetError is rethrown after
// top_up_trace.json has been written; nothing is packaged then.
PipelineSummary run_pipeline(const CurationConfig& cfg,
                             const std::filesystem::path& input_jsonl,
                             const std::filesystem::path& out_dir,
                             Synthesizer* synth,
                             const Validator& validator);

} // namespace golden
