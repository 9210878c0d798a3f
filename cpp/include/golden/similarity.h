// Golden/cpp/include/golden/similarity.h
#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "golden/item.h"
#include "golden/minhash.h"

namespace golden {

// Sorted, unique shingles.
using ShingleSet = std::vector<std::string>;

ShingleSet make_shingle_set(std::vector<std::string> shingles);

// |A n B| / |A u B|; exact(empty, empty) = 1.0, exact(A, empty) = 0.0
double exact_jaccard(const ShingleSet& a, const ShingleSet& b);

struct Fingerprint {
    std::string normalized;
    ShingleSet shingles;
    MinHashSketch sketch;
};

Fingerprint fingerprint_text(const std::string& raw, const MinHasher& hasher);

// Per-run cache keyed by candidate_id. References stay valid for the cache
// lifetime. Not thread-safe: warm it up before handing refs to workers.
class FingerprintCache {
public:
    explicit FingerprintCache(int num_perm = DEFAULT_NUM_PERM, uint64_t seed = DEFAULT_SEED)
        : hasher_(num_perm, seed) {}

    const Fingerprint& get(const Item& item);

    const MinHasher& hasher() const { return hasher_; }
    size_t size() const { return by_id_.size(); }

private:
    MinHasher hasher_;
    std::unordered_map<std::string, Fingerprint> by_id_;
};

// max exact Jaccard of `cand` against every item in `others` whose
// candidate_id != skip_id. 0.0 when nothing to compare against.
double max_exact_jaccard(const Item& cand,
                         const std::vector<const Item*>& others,
                         FingerprintCache& cache,
                         const std::string& skip_id = std::string());

} // namespace golden
