// Golden/cpp/src/minhash.cpp
#include "golden/minhash.h"
#include "golden/errors.h"

#include <limits>
#include <random>

#include "text_common.h"

namespace golden {

namespace {

constexpr uint64_t kMersenne61 = (1ULL << 61) - 1;
constexpr uint32_t kMaxHash = std::numeric_limits<uint32_t>::max();

// x < 2^64 folded once; result < 2^61 - 1.
static inline uint64_t mod_mersenne61(uint64_t x) {
    uint64_t r = (x & kMersenne61) + (x >> 61);
    if (r >= kMersenne61) r -= kMersenne61;
    return r;
}

// a * b mod 2^61 - 1 for a, b < 2^61, over 32-bit halves (2^64 == 8 mod p).
static inline uint64_t mulmod_mersenne61(uint64_t a, uint64_t b) {
    const uint64_t ah = a >> 32, al = a & 0xffffffffULL;
    const uint64_t bh = b >> 32, bl = b & 0xffffffffULL;
    const uint64_t hi = (ah * bh) << 3;
    const uint64_t mid = ah * bl + al * bh;
    const uint64_t mid_part = (mid >> 29) + ((mid & ((1ULL << 29) - 1)) << 32);
    return mod_mersenne61(hi + mid_part + mod_mersenne61(al * bl));
}

} // namespace

MinHasher::MinHasher(int num_perm, uint64_t seed) : seed_(seed) {
    if (num_perm <= 0) throw GoldenException(ErrorCode::InvalidArgs, "num_perm must be > 0");

    std::mt19937_64 gen(seed);
    a_.resize((size_t)num_perm);
    b_.resize((size_t)num_perm);
    for (int i = 0; i < num_perm; ++i) {
        a_[(size_t)i] = 1 + gen() % (kMersenne61 - 1);
        b_[(size_t)i] = gen() % kMersenne61;
    }
}

MinHashSketch MinHasher::sketch(const std::vector<std::string>& shingles) const {
    MinHashSketch sk;
    sk.seed = seed_;
    sk.values.assign(a_.size(), kMaxHash);

    for (const auto& sh : shingles) {
        const uint64_t h = fnv1a64(sh) % kMersenne61;
        for (size_t i = 0; i < a_.size(); ++i) {
            const uint64_t x = mod_mersenne61(mulmod_mersenne61(a_[i], h) + b_[i]);
            const uint32_t v = (uint32_t)(x & kMaxHash);
            if (v < sk.values[i]) sk.values[i] = v;
        }
    }
    return sk;
}

double estimate_jaccard(const MinHashSketch& a, const MinHashSketch& b) {
    if (a.seed != b.seed || a.values.size() != b.values.size()) {
        throw GoldenException(ErrorCode::InvalidArgs,
                              "cannot compare sketches with different seeds or num_perm");
    }
    if (a.values.empty()) return 0.0;

    size_t eq = 0;
    for (size_t i = 0; i < a.values.size(); ++i) {
        if (a.values[i] == b.values[i]) ++eq;
    }
    return (double)eq / (double)a.values.size();
}

} // namespace golden
