// Golden/cpp/src/dedup.cpp
#include "golden/dedup.h"
#include "golden/errors.h"

#include <algorithm>
#include <deque>
#include <exception>
#include <iostream>
#include <mutex>
#include <thread>
#include <unordered_set>

namespace golden {

namespace {

struct PairHit {
    uint32_t i;
    uint32_t j;
    double exact;
};

} // namespace

DedupResult resolve_duplicates(const std::vector<Item>& pool,
                               FingerprintCache& cache,
                               const DedupOptions& opt) {
    const size_t n = pool.size();

    {
        std::unordered_set<std::string> seen;
        for (const auto& it : pool) {
            if (!seen.insert(it.candidate_id).second) {
                throw GoldenException(ErrorCode::InvalidArgs, "duplicate candidate_id in pool: " + it.candidate_id);
            }
        }
    }

    // warm the cache on this thread, workers only read
    std::vector<const Fingerprint*> fps(n, nullptr);
    for (size_t i = 0; i < n; ++i) fps[i] = &cache.get(pool[i]);

    unsigned num_threads = opt.max_threads ? opt.max_threads : 1;
    const unsigned hw = std::thread::hardware_concurrency();
    if (hw > 0 && num_threads > hw) num_threads = hw;
    if (n < 2) num_threads = 1;
    if (num_threads > n) num_threads = (unsigned)std::max<size_t>(1, n);

    std::vector<std::vector<PairHit>> per_thread(num_threads);
    std::exception_ptr first_err;
    std::mutex err_mu;

    auto work = [&](unsigned t) {
        try {
            auto& hits = per_thread[t];
            // rows strided so the triangular work spreads evenly
            for (size_t i = t; i < n; i += num_threads) {
                for (size_t j = i + 1; j < n; ++j) {
                    const double est = estimate_jaccard(fps[i]->sketch, fps[j]->sketch);
                    if (est < opt.threshold) continue;
                    const double ex = exact_jaccard(fps[i]->shingles, fps[j]->shingles);
                    hits.push_back(PairHit{(uint32_t)i, (uint32_t)j, ex});
                }
            }
        } catch (...) {
            std::lock_guard<std::mutex> lk(err_mu);
            if (!first_err) first_err = std::current_exception();
        }
    };

    if (num_threads == 1) {
        work(0);
    } else {
        std::vector<std::thread> workers;
        workers.reserve(num_threads);
        for (unsigned t = 0; t < num_threads; ++t) workers.emplace_back(work, t);
        for (auto& th : workers) th.join();
    }
    if (first_err) std::rethrow_exception(first_err);

    std::vector<PairHit> hits;
    for (auto& v : per_thread) hits.insert(hits.end(), v.begin(), v.end());
    std::sort(hits.begin(), hits.end(), [](const PairHit& a, const PairHit& b) {
        if (a.i != b.i) return a.i < b.i;
        return a.j < b.j;
    });

    std::vector<std::vector<uint32_t>> adj(n);
    DedupResult res;
    res.report.edges.reserve(hits.size());
    for (const auto& h : hits) {
        adj[h.i].push_back(h.j);
        adj[h.j].push_back(h.i);
        res.report.edges.push_back(DedupEdge{pool[h.i].candidate_id, pool[h.j].candidate_id, round4(h.exact)});
    }

    // BFS components, in order of smallest index
    std::vector<char> visited(n, 0);
    std::vector<char> keep(n, 0);
    for (size_t s = 0; s < n; ++s) {
        if (visited[s]) continue;
        std::vector<uint32_t> comp;
        std::deque<uint32_t> q;
        q.push_back((uint32_t)s);
        visited[s] = 1;
        while (!q.empty()) {
            const uint32_t u = q.front();
            q.pop_front();
            comp.push_back(u);
            for (uint32_t v : adj[u]) {
                if (!visited[v]) { visited[v] = 1; q.push_back(v); }
            }
        }

        uint32_t best = comp[0];
        DedupComponent dc;
        for (uint32_t u : comp) {
            dc.items.push_back(pool[u].candidate_id);
            if (pool[u].candidate_id < pool[best].candidate_id) best = u;
        }
        std::sort(dc.items.begin(), dc.items.end());
        dc.kept = pool[best].candidate_id;
        keep[best] = 1;

        if (comp.size() > 1) {
            for (const auto& id : dc.items) {
                if (id != dc.kept) std::cerr << "DEDUP_DROP: " << id << " (kept " << dc.kept << ")\n";
            }
        }
        res.report.components.push_back(std::move(dc));
    }

    for (size_t i = 0; i < n; ++i) {
        if (keep[i]) res.kept.push_back(pool[i]);
        else res.dropped.push_back(pool[i]);
    }
    return res;
}

nlohmann::json to_json(const DedupReport& r) {
    nlohmann::json j;
    j["components"] = nlohmann::json::array();
    for (const auto& c : r.components) {
        nlohmann::json cj;
        cj["items"] = c.items;
        cj["kept"] = c.kept;
        j["components"].push_back(cj);
    }
    j["edges"] = nlohmann::json::array();
    for (const auto& e : r.edges) {
        nlohmann::json ej;
        ej["source"] = e.source;
        ej["target"] = e.target;
        ej["jaccard"] = e.jaccard;
        j["edges"].push_back(ej);
    }
    return j;
}

} // namespace golden
