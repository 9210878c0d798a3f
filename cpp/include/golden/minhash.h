// Golden/cpp/include/golden/minhash.h
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "golden/format.h"

namespace golden {

struct MinHashSketch {
    uint64_t seed{DEFAULT_SEED};
    std::vector<uint32_t> values; // one slot per permutation

    bool operator==(const MinHashSketch& o) const { return seed == o.seed && values == o.values; }
};

// Universal-hash permutations (a*h + b) mod (2^61 - 1), truncated to 32 bits.
// (a, b) come from std::mt19937_64(seed), base hash is FNV-1a 64 of the shingle
// bytes, so sketches are bit-identical across runs and platforms.
class MinHasher {
public:
    explicit MinHasher(int num_perm = DEFAULT_NUM_PERM, uint64_t seed = DEFAULT_SEED);

    MinHashSketch sketch(const std::vector<std::string>& shingles) const;

    int num_perm() const { return (int)a_.size(); }
    uint64_t seed() const { return seed_; }

private:
    uint64_t seed_{DEFAULT_SEED};
    std::vector<uint64_t> a_;
    std::vector<uint64_t> b_;
};

// Fraction of equal slots. Throws InvalidArgs on num_perm/seed mismatch.
double estimate_jaccard(const MinHashSketch& a, const MinHashSketch& b);

} // namespace golden
