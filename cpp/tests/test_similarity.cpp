#include <cassert>
#include <cmath>
#include <iostream>
#include <random>
#include <string>

#include "golden/errors.h"
#include "golden/minhash.h"
#include "golden/similarity.h"
#include "test_util.h"
#include "text_common.h"

namespace {

constexpr uint64_t kP61 = (1ULL << 61) - 1;

// (a * b) mod 2^61 - 1 by shift-and-add, no wide multiply.
uint64_t slow_mulmod(uint64_t a, uint64_t b) {
    uint64_t r = 0;
    a %= kP61;
    while (b) {
        if (b & 1) r = (r + a) % kP61;
        a = (a << 1) % kP61;
        b >>= 1;
    }
    return r;
}

// Recomputes a sketch the long way from the same (a, b) draws.
std::vector<uint32_t> reference_sketch(int num_perm, uint64_t seed,
                                       const std::vector<std::string>& shingles) {
    std::mt19937_64 gen(seed);
    std::vector<uint64_t> a((size_t)num_perm), b((size_t)num_perm);
    for (int i = 0; i < num_perm; ++i) {
        a[(size_t)i] = 1 + gen() % (kP61 - 1);
        b[(size_t)i] = gen() % kP61;
    }
    std::vector<uint32_t> out((size_t)num_perm, 0xffffffffu);
    for (const auto& sh : shingles) {
        const uint64_t h = fnv1a64(sh) % kP61;
        for (size_t i = 0; i < a.size(); ++i) {
            const uint64_t x = (slow_mulmod(a[i], h) + b[i]) % kP61;
            const uint32_t v = (uint32_t)(x & 0xffffffffu);
            if (v < out[i]) out[i] = v;
        }
    }
    return out;
}

} // namespace

int main() {
    using namespace golden;

    // exact Jaccard edge cases
    assert(exact_jaccard({}, {}) == 1.0);
    assert(exact_jaccard(make_shingle_set({"a b c"}), {}) == 0.0);
    const ShingleSet a = make_shingle_set({"x", "y", "z", "x"});
    const ShingleSet b = make_shingle_set({"y", "z", "w"});
    assert(a.size() == 3);
    assert(std::fabs(exact_jaccard(a, b) - 0.5) < 1e-12);

    // sketches are deterministic per seed
    MinHasher h1(128, 2025), h2(128, 2025), h3(128, 7);
    const std::vector<std::string> sh = {"a b c", "b c d", "c d e"};
    assert(h1.sketch(sh) == h2.sketch(sh));
    assert(!(h1.sketch(sh) == h3.sketch(sh)));
    assert(h1.sketch(sh).values.size() == 128);
    assert(estimate_jaccard(h1.sketch(sh), h2.sketch(sh)) == 1.0);

    // permutation arithmetic matches a plain modular reference
    assert(h1.sketch(sh).values == reference_sketch(128, 2025, sh));
    assert(h3.sketch(sh).values == reference_sketch(128, 7, sh));
    const std::vector<std::string> many = {"zz yy xx", "lorem ipsum dolor", "q", "0 1 2"};
    assert(h1.sketch(many).values == reference_sketch(128, 2025, many));

    bool threw = false;
    try {
        estimate_jaccard(h1.sketch(sh), h3.sketch(sh));
    } catch (const GoldenException& e) {
        threw = e.code() == ErrorCode::InvalidArgs;
    }
    assert(threw);

    // near-duplicate texts: high estimate, exact close to the estimate
    const std::string base = make_text("alpha", 400);
    std::string edited = base;
    edited.replace(edited.rfind("alphaw399"), 9, "betaw399");

    FingerprintCache cache;
    Item x = make_item("x", "blog", Band::Standard, base);
    Item y = make_item("y", "blog", Band::Standard, edited);
    Item z = make_unique_item("z", "blog", Band::Standard);

    const auto& fx = cache.get(x);
    const auto& fy = cache.get(y);
    const double est = estimate_jaccard(fx.sketch, fy.sketch);
    const double ex = exact_jaccard(fx.shingles, fy.shingles);
    assert(ex > 0.98);
    assert(est >= 0.85);
    assert(std::fabs(est - ex) < 0.1);
    assert(cache.size() == 2);
    assert(&cache.get(x) == &fx);

    // max over others
    assert(max_exact_jaccard(z, {}, cache) == 0.0);
    assert(max_exact_jaccard(x, {&y, &z}, cache) == ex);
    assert(max_exact_jaccard(x, {&x, &z}, cache, "x") == 0.0);

    std::cout << "OK\n";
    return 0;
}
