// Golden/cpp/include/golden/diversity.h
#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "golden/item.h"
#include "golden/similarity.h"

namespace golden {

// Dense L2-normalized TF-IDF rows. Vocabulary: lowercase word tokens of
// length >= 2, unigrams + bigrams, df >= 2 and df <= 0.9 * n, sorted.
// idf = ln((1 + n) / (1 + df)) + 1 on raw counts.
struct TfidfMatrix {
    std::vector<std::string> vocab;
    std::vector<std::vector<double>> rows;
};

TfidfMatrix build_tfidf(const std::vector<std::string>& texts);

struct KMeansOptions {
    int n_init{10};
    int max_iter{300};
    double tol{1e-4};        // total squared centroid shift
    uint32_t seed{2025};
};

struct KMeansResult {
    std::vector<int> labels;
    std::vector<std::vector<double>> centroids;
    double inertia{0.0};
};

// k-means++ seeding, Lloyd iterations, best of n_init by inertia.
// k is clamped to [1, n]. Empty clusters take the point farthest from its centroid.
KMeansResult kmeans(const std::vector<std::vector<double>>& rows, int k, const KMeansOptions& opt = KMeansOptions());

// k = max(7, round(sqrt(n))), clamped to n
int cluster_count_for(size_t n);

// 4dp; 0 for empty or all-zero input
double gini(std::vector<int> sizes);

struct ClusterEval {
    std::map<int, int> counts;   // label -> size (labels present only)
    double gini{0.0};
    int min_cluster_size{0};
    bool is_diverse{false};
    std::string reason;          // empty when diverse
};

ClusterEval evaluate_clusters(const std::vector<int>& labels, int min_cluster_size = 3, double max_gini = 0.40);

struct ShannonReport {
    std::map<std::string, int> archetype_counts;
    double entropy{0.0};         // 4dp
    double normalized{0.0};      // H / ln(#archetypes), 4dp
    double threshold{0.97};
    bool is_diverse{false};
};

ShannonReport shannon_diversity(const std::vector<Item>& items, double threshold = 0.97);

struct SwapRecord {
    int swap_idx{0};
    std::string removed;
    std::string added;
    int cluster{0};
    double max_jaccard{0.0};
};

struct DiversityOptions {
    int max_swaps{5};
    int min_cluster_size{3};
    double max_gini{0.40};
    double shannon_threshold{0.97};
    KMeansOptions kmeans;
};

struct DiversityResult {
    std::vector<Item> items;
    ClusterEval cluster;
    ShannonReport shannon;
    std::vector<SwapRecord> swaps;
    std::string stopped_reason;  // diverse | no_replacement | budget_exhausted
};

// Swaps the most central member of the largest cluster for the least similar
// same-stratum, same-band candidate of `superset` until diverse or out of budget.
// A swapped-in item takes over the rep/seq/slot_id of the item it replaces.
DiversityResult enforce_diversity(const std::vector<Item>& items,
                                  const std::vector<Item>& superset,
                                  FingerprintCache& cache,
                                  const DiversityOptions& opt = DiversityOptions());

nlohmann::json to_json(const ClusterEval& c);
nlohmann::json to_json(const ShannonReport& s);
nlohmann::json to_json(const DiversityResult& r);

} // namespace golden
