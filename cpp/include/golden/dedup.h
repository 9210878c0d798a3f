// Golden/cpp/include/golden/dedup.h
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "golden/format.h"
#include "golden/item.h"
#include "golden/similarity.h"

namespace golden {

struct DedupOptions {
    double threshold{0.85};       // on estimated Jaccard
    unsigned max_threads{16};     // pair rows are strided over workers
};

struct DedupEdge {
    std::string source;
    std::string target;
    double jaccard{0.0};          // exact, 4dp
};

struct DedupComponent {
    std::vector<std::string> items; // sorted ids
    std::string kept;
};

struct DedupReport {
    std::vector<DedupComponent> components; // by smallest pool index
    std::vector<DedupEdge> edges;           // by (i, j)
};

struct DedupResult {
    std::vector<Item> kept;       // pool order
    std::vector<Item> dropped;    // pool order
    DedupReport report;
};

// One survivor per connected component of the estimated-similarity graph:
// the lexicographically smallest candidate_id. Output does not depend on
// max_threads. Duplicate candidate_id in the pool => InvalidArgs.
DedupResult resolve_duplicates(const std::vector<Item>& pool,
                               FingerprintCache& cache,
                               const DedupOptions& opt);

nlohmann::json to_json(const DedupReport& r);

} // namespace golden
