// Golden/cpp/src/similarity.cpp
#include "golden/similarity.h"

#include <algorithm>

#include "text_common.h"

namespace golden {

ShingleSet make_shingle_set(std::vector<std::string> shingles) {
    std::sort(shingles.begin(), shingles.end());
    shingles.erase(std::unique(shingles.begin(), shingles.end()), shingles.end());
    return shingles;
}

double exact_jaccard(const ShingleSet& a, const ShingleSet& b) {
    if (a.empty() && b.empty()) return 1.0;
    if (a.empty() || b.empty()) return 0.0;

    size_t inter = 0;
    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        const int c = a[i].compare(b[j]);
        if (c == 0) { ++inter; ++i; ++j; }
        else if (c < 0) ++i;
        else ++j;
    }
    const size_t uni = a.size() + b.size() - inter;
    return (double)inter / (double)uni;
}

Fingerprint fingerprint_text(const std::string& raw, const MinHasher& hasher) {
    Fingerprint fp;
    fp.normalized = normalize_spec_text(raw);
    fp.shingles = make_shingle_set(word_shingles(tokenize_words(fp.normalized), K_SHINGLE));
    fp.sketch = hasher.sketch(fp.shingles);
    return fp;
}

const Fingerprint& FingerprintCache::get(const Item& item) {
    auto it = by_id_.find(item.candidate_id);
    if (it != by_id_.end()) return it->second;
    auto ins = by_id_.emplace(item.candidate_id, fingerprint_text(item.spec, hasher_));
    return ins.first->second;
}

double max_exact_jaccard(const Item& cand,
                         const std::vector<const Item*>& others,
                         FingerprintCache& cache,
                         const std::string& skip_id) {
    const ShingleSet& cs = cache.get(cand).shingles;
    double best = 0.0;
    for (const Item* o : others) {
        if (!skip_id.empty() && o->candidate_id == skip_id) continue;
        const double j = exact_jaccard(cs, cache.get(*o).shingles);
        if (j > best) best = j;
    }
    return best;
}

} // namespace golden
