// Golden/cpp/src/diversity.cpp
#include "golden/diversity.h"
#include "golden/format.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <limits>
#include <random>
#include <set>
#include <unordered_map>

#include "text_common.h"

namespace golden {

// --------------------
// TF-IDF
// --------------------

static std::vector<std::string> tfidf_terms(const std::string& text) {
    std::vector<std::string> toks;
    for (auto& t : tokenize_words(text)) {
        if (t.size() >= 2) toks.push_back(std::move(t));
    }
    std::vector<std::string> terms = toks;
    for (size_t i = 0; i + 1 < toks.size(); ++i) terms.push_back(toks[i] + " " + toks[i + 1]);
    return terms;
}

TfidfMatrix build_tfidf(const std::vector<std::string>& texts) {
    const size_t n = texts.size();
    std::vector<std::unordered_map<std::string, int>> tf(n);
    std::map<std::string, int> df;

    for (size_t d = 0; d < n; ++d) {
        for (auto& t : tfidf_terms(texts[d])) tf[d][t] += 1;
        for (const auto& kv : tf[d]) df[kv.first] += 1;
    }

    const double max_df = 0.9 * (double)n;
    TfidfMatrix m;
    std::unordered_map<std::string, size_t> col;
    std::vector<double> idf;
    for (const auto& kv : df) {  // std::map => sorted vocabulary
        if (kv.second < 2 || (double)kv.second > max_df) continue;
        col[kv.first] = m.vocab.size();
        m.vocab.push_back(kv.first);
        idf.push_back(std::log((1.0 + (double)n) / (1.0 + (double)kv.second)) + 1.0);
    }

    m.rows.assign(n, std::vector<double>(m.vocab.size(), 0.0));
    for (size_t d = 0; d < n; ++d) {
        auto& row = m.rows[d];
        for (const auto& kv : tf[d]) {
            auto it = col.find(kv.first);
            if (it == col.end()) continue;
            row[it->second] = (double)kv.second * idf[it->second];
        }
        double norm = 0.0;
        for (double v : row) norm += v * v;
        norm = std::sqrt(norm);
        if (norm > 0.0) {
            for (double& v : row) v /= norm;
        }
    }
    return m;
}

// --------------------
// k-means
// --------------------

static double sq_dist(const std::vector<double>& a, const std::vector<double>& b) {
    double s = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        const double d = a[i] - b[i];
        s += d * d;
    }
    return s;
}

static inline double uniform01(std::mt19937& g) {
    return (double)g() / 4294967296.0;
}

static std::vector<std::vector<double>> seed_plus_plus(const std::vector<std::vector<double>>& x, int k, std::mt19937& g) {
    const size_t n = x.size();
    std::vector<std::vector<double>> c;
    c.reserve((size_t)k);
    c.push_back(x[(size_t)(uniform01(g) * (double)n) % n]);

    std::vector<double> best(n, std::numeric_limits<double>::max());
    while ((int)c.size() < k) {
        double total = 0.0;
        for (size_t i = 0; i < n; ++i) {
            best[i] = std::min(best[i], sq_dist(x[i], c.back()));
            total += best[i];
        }
        size_t pick = n - 1;
        if (total <= 1e-12) {
            pick = (size_t)(uniform01(g) * (double)n) % n;
        } else {
            const double r = uniform01(g) * total;
            double acc = 0.0;
            for (size_t i = 0; i < n; ++i) {
                acc += best[i];
                if (acc > r) { pick = i; break; }
            }
        }
        c.push_back(x[pick]);
    }
    return c;
}

static double assign_labels(const std::vector<std::vector<double>>& x,
                            const std::vector<std::vector<double>>& c,
                            std::vector<int>& labels,
                            std::vector<double>& dist) {
    double inertia = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        int bk = 0;
        double bd = std::numeric_limits<double>::max();
        for (size_t j = 0; j < c.size(); ++j) {
            const double d = sq_dist(x[i], c[j]);
            if (d < bd) { bd = d; bk = (int)j; }
        }
        labels[i] = bk;
        dist[i] = bd;
        inertia += bd;
    }
    return inertia;
}

static KMeansResult lloyd(const std::vector<std::vector<double>>& x, std::vector<std::vector<double>> c, const KMeansOptions& opt) {
    const size_t n = x.size();
    const size_t k = c.size();
    const size_t dim = x.empty() ? 0 : x[0].size();

    std::vector<int> labels(n, -1);
    std::vector<int> prev(n, -1);
    std::vector<double> dist(n, 0.0);

    for (int iter = 0; iter < opt.max_iter; ++iter) {
        assign_labels(x, c, labels, dist);

        std::vector<std::vector<double>> next(k, std::vector<double>(dim, 0.0));
        std::vector<int> cnt(k, 0);
        for (size_t i = 0; i < n; ++i) {
            auto& dst = next[(size_t)labels[i]];
            for (size_t d = 0; d < dim; ++d) dst[d] += x[i][d];
            cnt[(size_t)labels[i]] += 1;
        }

        std::vector<char> used(n, 0);
        for (size_t j = 0; j < k; ++j) {
            if (cnt[j] > 0) {
                for (double& v : next[j]) v /= (double)cnt[j];
                continue;
            }
            // пустой кластер: самая далёкая от своего центра точка
            size_t far = 0;
            double fd = -1.0;
            for (size_t i = 0; i < n; ++i) {
                if (!used[i] && dist[i] > fd) { fd = dist[i]; far = i; }
            }
            used[far] = 1;
            next[j] = x[far];
        }

        double shift = 0.0;
        for (size_t j = 0; j < k; ++j) shift += sq_dist(c[j], next[j]);
        c.swap(next);

        const bool same = labels == prev;
        prev = labels;
        if (same || shift <= opt.tol) break;
    }

    KMeansResult r;
    r.labels.assign(n, 0);
    r.inertia = assign_labels(x, c, r.labels, dist);
    r.centroids = std::move(c);
    return r;
}

KMeansResult kmeans(const std::vector<std::vector<double>>& rows, int k, const KMeansOptions& opt) {
    KMeansResult best;
    if (rows.empty()) return best;

    k = std::max(1, std::min(k, (int)rows.size()));
    std::mt19937 g(opt.seed);

    bool have = false;
    const int runs = std::max(1, opt.n_init);
    for (int r = 0; r < runs; ++r) {
        KMeansResult cur = lloyd(rows, seed_plus_plus(rows, k, g), opt);
        if (!have || cur.inertia < best.inertia) {
            best = std::move(cur);
            have = true;
        }
    }
    return best;
}

int cluster_count_for(size_t n) {
    if (n == 0) return 0;
    const int k = std::max(7, (int)std::lround(std::sqrt((double)n)));
    return std::min(k, (int)n);
}

// --------------------
// evaluation
// --------------------

double gini(std::vector<int> sizes) {
    std::sort(sizes.begin(), sizes.end());
    const size_t n = sizes.size();
    double total = 0.0;
    for (int s : sizes) total += s;
    if (n == 0 || total == 0.0) return 0.0;

    double weighted = 0.0;
    for (size_t i = 0; i < n; ++i) weighted += (double)(n - i) * (double)sizes[i];
    const double g = ((double)n + 1.0 - 2.0 * weighted / total) / (double)n;
    return round4(g);
}

static std::string fmt4(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4f", v);
    return buf;
}

ClusterEval evaluate_clusters(const std::vector<int>& labels, int min_cluster_size, double max_gini) {
    ClusterEval e;
    for (int l : labels) e.counts[l] += 1;

    std::vector<int> sizes;
    for (const auto& kv : e.counts) sizes.push_back(kv.second);
    e.gini = gini(sizes);
    e.min_cluster_size = sizes.empty() ? 0 : *std::min_element(sizes.begin(), sizes.end());
    e.is_diverse = e.min_cluster_size >= min_cluster_size && e.gini <= max_gini;

    if (e.min_cluster_size < min_cluster_size) {
        e.reason = "min cluster size " + std::to_string(e.min_cluster_size) + " < required " + std::to_string(min_cluster_size);
    } else if (e.gini > max_gini) {
        e.reason = "gini " + fmt4(e.gini) + " > max " + fmt4(max_gini);
    }
    return e;
}

ShannonReport shannon_diversity(const std::vector<Item>& items, double threshold) {
    ShannonReport r;
    r.threshold = threshold;
    for (const auto& it : items) r.archetype_counts[it.archetype] += 1;

    const double total = (double)items.size();
    double h = 0.0;
    for (const auto& kv : r.archetype_counts) {
        const double p = (double)kv.second / total;
        h -= p * std::log(p);
    }
    const double hmax = r.archetype_counts.empty() ? 0.0 : std::log((double)r.archetype_counts.size());
    const double hn = hmax > 0.0 ? h / hmax : 0.0;

    r.entropy = round4(h);
    r.normalized = round4(hn);
    r.is_diverse = hn >= threshold;
    return r;
}

// --------------------
// swap loop
// --------------------

namespace {

struct Clustering {
    KMeansResult km;
    ClusterEval eval;
    std::vector<std::vector<double>> rows;
};

Clustering cluster_items(const std::vector<Item>& items, FingerprintCache& cache, const DiversityOptions& opt) {
    std::vector<std::string> texts;
    texts.reserve(items.size());
    for (const auto& it : items) texts.push_back(cache.get(it).normalized);

    Clustering c;
    c.rows = build_tfidf(texts).rows;
    c.km = kmeans(c.rows, cluster_count_for(items.size()), opt.kmeans);
    c.eval = evaluate_clusters(c.km.labels, opt.min_cluster_size, opt.max_gini);
    return c;
}

} // namespace

DiversityResult enforce_diversity(const std::vector<Item>& items,
                                  const std::vector<Item>& superset,
                                  FingerprintCache& cache,
                                  const DiversityOptions& opt) {
    DiversityResult res;
    res.items = items;

    if (items.empty()) {
        res.cluster = evaluate_clusters({}, opt.min_cluster_size, opt.max_gini);
        res.shannon = shannon_diversity(res.items, opt.shannon_threshold);
        res.stopped_reason = res.cluster.is_diverse ? "diverse" : "no_replacement";
        return res;
    }

    Clustering cl = cluster_items(res.items, cache, opt);

    for (int s = 0; s < opt.max_swaps && !cl.eval.is_diverse; ++s) {
        // largest cluster, ties => lowest label
        int largest = cl.eval.counts.begin()->first;
        for (const auto& kv : cl.eval.counts) {
            if (kv.second > cl.eval.counts.at(largest)) largest = kv.first;
        }

        size_t central = 0;
        double best = std::numeric_limits<double>::max();
        for (size_t i = 0; i < res.items.size(); ++i) {
            if (cl.km.labels[i] != largest) continue;
            const double d = std::sqrt(sq_dist(cl.rows[i], cl.km.centroids[(size_t)largest]));
            if (d < best) { best = d; central = i; }
        }
        const Item& victim = res.items[central];

        std::set<std::string> present;
        for (const auto& it : res.items) present.insert(it.candidate_id);

        std::vector<const Item*> others;
        for (const auto& it : res.items) {
            if (it.candidate_id != victim.candidate_id) others.push_back(&it);
        }

        const Item* pick = nullptr;
        double pick_score = 0.0;
        for (const auto& cand : superset) {
            if (cand.stratum() != victim.stratum() || cand.length_band != victim.length_band) continue;
            if (present.count(cand.candidate_id)) continue;
            const double sc = max_exact_jaccard(cand, others, cache);
            if (!pick || sc < pick_score || (sc == pick_score && cand.candidate_id < pick->candidate_id)) {
                pick = &cand;
                pick_score = sc;
            }
        }

        if (!pick) {
            std::cerr << "[golden.diversity] no replacement candidates for " << victim.candidate_id << "\n";
            res.stopped_reason = "no_replacement";
            break;
        }

        SwapRecord rec;
        rec.swap_idx = s + 1;
        rec.removed = victim.candidate_id;
        rec.added = pick->candidate_id;
        rec.cluster = largest;
        rec.max_jaccard = round4(pick_score);
        res.swaps.push_back(rec);

        Item incoming = *pick;
        incoming.rep = victim.rep;
        incoming.seq = victim.seq;
        incoming.slot_id = victim.slot_id;
        incoming.source_candidate_id = incoming.candidate_id;
        res.items[central] = std::move(incoming);

        cl = cluster_items(res.items, cache, opt);
    }

    res.cluster = cl.eval;
    res.shannon = shannon_diversity(res.items, opt.shannon_threshold);
    if (res.stopped_reason.empty()) res.stopped_reason = cl.eval.is_diverse ? "diverse" : "budget_exhausted";

    if (!cl.eval.is_diverse) {
        std::cerr << "DIV_C_ERR: failed to achieve cluster diversity (" << cl.eval.reason << ", swaps="
                  << res.swaps.size() << ")\n";
    }
    if (!res.shannon.is_diverse) {
        std::cerr << "[golden.diversity] WARNING: shannon H/Hmax " << res.shannon.normalized
                  << " < " << res.shannon.threshold << "\n";
    }
    return res;
}

nlohmann::json to_json(const ClusterEval& c) {
    nlohmann::json j;
    j["cluster_counts"] = nlohmann::json::object();
    for (const auto& kv : c.counts) j["cluster_counts"][std::to_string(kv.first)] = kv.second;
    j["gini"] = c.gini;
    j["min_cluster_size"] = c.min_cluster_size;
    j["is_diverse"] = c.is_diverse;
    if (c.reason.empty()) j["reason"] = nullptr;
    else j["reason"] = c.reason;
    return j;
}

nlohmann::json to_json(const ShannonReport& s) {
    nlohmann::json j;
    j["archetype_counts"] = s.archetype_counts;
    j["shannon_entropy"] = s.entropy;
    j["normalized_entropy"] = s.normalized;
    j["threshold"] = s.threshold;
    j["is_diverse"] = s.is_diverse;
    return j;
}

nlohmann::json to_json(const DiversityResult& r) {
    nlohmann::json j;
    j["cluster_diversity"] = to_json(r.cluster);
    j["shannon_diversity"] = to_json(r.shannon);
    j["swaps"] = nlohmann::json::array();
    for (const auto& s : r.swaps) {
        j["swaps"].push_back(nlohmann::json{{"swap_idx", s.swap_idx},
                                            {"removed", s.removed},
                                            {"added", s.added},
                                            {"cluster", s.cluster},
                                            {"max_jaccard", s.max_jaccard}});
    }
    j["stopped_reason"] = r.stopped_reason;
    return j;
}

} // namespace golden
