#include <cassert>
#include <cmath>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "golden/diversity.h"
#include "test_util.h"

using namespace golden;

static void test_gini_and_eval() {
    assert(gini({}) == 0.0);
    assert(gini({5, 5}) == 0.0);
    assert(gini({1, 9}) == 0.4);
    assert(gini({0, 0, 0}) == 0.0);

    ClusterEval e = evaluate_clusters({0, 0, 0, 1, 1, 1});
    assert(e.is_diverse && e.reason.empty());
    assert(e.counts.size() == 2 && e.min_cluster_size == 3);

    e = evaluate_clusters({0, 0, 0, 0, 1});
    assert(!e.is_diverse);
    assert(e.reason.find("min cluster size 1") == 0);

    auto j = to_json(e);
    assert(j["cluster_counts"]["0"] == 4);
    assert(j["reason"].is_string());

    assert(cluster_count_for(0) == 0);
    assert(cluster_count_for(3) == 3);
    assert(cluster_count_for(70) == 8);
    assert(cluster_count_for(20) == 7);
}

static void test_tfidf() {
    const TfidfMatrix m = build_tfidf({"alpha beta gamma", "alpha beta delta", "alpha zeta eta", "x"});
    // alpha is in 3 of 4 docs (<= 0.9 * 4), beta in 2, singletons dropped
    std::set<std::string> vocab(m.vocab.begin(), m.vocab.end());
    assert(vocab.count("alpha"));
    assert(vocab.count("beta"));
    assert(vocab.count("alpha beta"));
    assert(!vocab.count("gamma"));
    assert(!vocab.count("x"));

    for (size_t i = 0; i < 3; ++i) {
        double n = 0.0;
        for (double v : m.rows[i]) n += v * v;
        assert(std::fabs(n - 1.0) < 1e-9);
    }
    for (double v : m.rows[3]) assert(v == 0.0);

    // term in every doc exceeds max_df
    const TfidfMatrix all = build_tfidf({"same word", "same thing", "same stuff"});
    for (const auto& t : all.vocab) assert(t != "same");
}

static void test_kmeans() {
    std::vector<std::vector<double>> pts = {
        {0.0, 0.0}, {0.1, 0.0}, {0.0, 0.1},
        {5.0, 5.0}, {5.1, 5.0}, {5.0, 5.1},
    };
    const KMeansResult a = kmeans(pts, 2);
    const KMeansResult b = kmeans(pts, 2);
    assert(a.labels == b.labels);
    assert(a.labels[0] == a.labels[1] && a.labels[1] == a.labels[2]);
    assert(a.labels[3] == a.labels[4] && a.labels[4] == a.labels[5]);
    assert(a.labels[0] != a.labels[3]);
    assert(a.inertia < 0.1);

    // k larger than n is clamped
    const KMeansResult c = kmeans(pts, 50);
    assert(c.centroids.size() == 6);
}

static Item word_item(const std::string& id, const std::string& words) {
    return make_item(id, "blog", Band::Standard, words);
}

static void test_no_replacement() {
    std::vector<Item> items = {
        word_item("da", "alpha beta"),
        word_item("db", "beta gamma"),
        word_item("dc", "gamma alpha"),
    };
    FingerprintCache cache;
    const DiversityResult r = enforce_diversity(items, {}, cache);
    assert(!r.cluster.is_diverse);
    assert(r.stopped_reason == "no_replacement");
    assert(r.swaps.empty());
    assert(r.items.size() == 3);
}

// Six singleton points plus one point shared by four items: the shared
// point is the only cluster above size 1.
static std::vector<Item> swap_fixture() {
    std::vector<Item> items;
    const char* pairs[6] = {"apple berry", "berry cherry", "cherry damson",
                            "damson elder", "elder fig", "fig apple"};
    for (int i = 0; i < 6; ++i) items.push_back(word_item("p" + std::to_string(i + 1), pairs[i]));
    for (int i = 1; i <= 4; ++i) items.push_back(word_item("bg" + std::to_string(i), "granite quartz basalt"));
    for (size_t i = 0; i < items.size(); ++i) {
        items[i].rep = (int)i % 5 + 1;
        items[i].seq = (int)i + 1;
        items[i].slot_id = "slot_" + std::to_string(i + 1);
    }
    return items;
}

static void test_swaps() {
    const std::vector<Item> items = swap_fixture();

    std::vector<Item> superset = items;
    Item short_one = word_item("c0", "kumquat lime mango");
    short_one.length_band = Band::Short;
    superset.push_back(short_one);                                              // wrong band
    superset.push_back(make_item("cb", "notes", Band::Standard, "nectarine orange pear"));  // wrong stratum
    superset.push_back(word_item("ca", "granite quartz basalt olive"));         // shares a shingle
    superset.push_back(word_item("cz", "sloe tamarind ugli"));
    superset.push_back(word_item("cy", "plum quince raisin"));

    FingerprintCache cache;
    DiversityOptions opt;
    opt.max_swaps = 1;
    const DiversityResult r1 = enforce_diversity(items, superset, cache, opt);
    const DiversityResult r2 = enforce_diversity(items, superset, cache, opt);
    assert(to_json(r1) == to_json(r2));

    assert(r1.swaps.size() == 1);
    assert(r1.stopped_reason == "budget_exhausted");
    assert(!r1.cluster.is_diverse);

    // victim: first item at the centroid of the 4-item cluster
    const SwapRecord& s = r1.swaps[0];
    assert(s.swap_idx == 1);
    assert(s.removed == "bg1");
    // cy and cz both score 0, the lower id wins; ca scores 0.5
    assert(s.added == "cy");
    assert(s.max_jaccard == 0.0);

    // the incoming item takes the removed item's place
    assert(r1.items.size() == items.size());
    const Item& in = r1.items[6];
    assert(in.candidate_id == "cy");
    assert(in.slot_id == items[6].slot_id);
    assert(in.rep == items[6].rep && in.seq == items[6].seq);
    assert(in.source_candidate_id == "cy");
    assert(in.spec == "plum quince raisin");
    for (size_t i = 0; i < items.size(); ++i) {
        if (i != 6) assert(r1.items[i].candidate_id == items[i].candidate_id);
    }

    // second swap takes the next item of the same cluster and the next free candidate
    opt.max_swaps = 2;
    const DiversityResult r3 = enforce_diversity(items, superset, cache, opt);
    assert(r3.swaps.size() == 2);
    assert(r3.swaps[1].removed == "bg2" && r3.swaps[1].added == "cz");
    assert(r3.items[7].slot_id == "slot_8");

    auto j = to_json(r1);
    assert(j.contains("cluster_diversity") && j.contains("shannon_diversity") && j["swaps"].is_array());
    assert(j["swaps"][0]["removed"] == "bg1");
}

static void test_shannon() {
    std::vector<Item> items;
    for (const char* a : {"blog", "chat", "notes", "store"}) {
        for (int i = 0; i < 5; ++i) items.push_back(make_item(std::string(a) + std::to_string(i), a, Band::Standard, ""));
    }
    ShannonReport s = shannon_diversity(items);
    assert(s.normalized == 1.0);
    assert(s.is_diverse);
    assert(std::fabs(s.entropy - round4(std::log(4.0))) < 1e-12);

    items.resize(17); // 5/5/5/2
    s = shannon_diversity(items);
    assert(s.normalized < 1.0);
}

int main() {
    test_gini_and_eval();
    test_tfidf();
    test_kmeans();
    test_no_replacement();
    test_swaps();
    test_shannon();
    std::cout << "OK\n";
    return 0;
}
