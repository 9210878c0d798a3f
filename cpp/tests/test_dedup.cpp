#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "golden/dedup.h"
#include "golden/errors.h"
#include "test_util.h"

using namespace golden;

static std::string near_copy(const std::string& text, const std::string& last_tok, const std::string& repl) {
    std::string s = text;
    s.replace(s.rfind(last_tok), last_tok.size(), repl);
    return s;
}

int main() {
    const std::string t1 = make_text("one", 500);
    std::vector<Item> pool;
    pool.push_back(make_item("cand_b", "blog", Band::Standard, t1));
    pool.push_back(make_unique_item("cand_x", "blog", Band::Standard));
    pool.push_back(make_item("cand_a", "blog", Band::Standard, near_copy(t1, "onew499", "zzz")));
    pool.push_back(make_item("cand_c", "blog", Band::Standard, near_copy(t1, "onew498", "yyy")));
    pool.push_back(make_unique_item("cand_y", "notes", Band::Short));

    FingerprintCache cache;
    DedupOptions opt;
    opt.max_threads = 1;
    const DedupResult r1 = resolve_duplicates(pool, cache, opt);

    // one component of 3, survivor is the smallest id
    assert(r1.kept.size() == 3);
    assert(r1.kept[0].candidate_id == "cand_x");
    assert(r1.kept[1].candidate_id == "cand_a");
    assert(r1.kept[2].candidate_id == "cand_y");
    assert(r1.dropped.size() == 2);

    assert(r1.report.components.size() == 3);
    const auto& big = r1.report.components[0];
    assert(big.items.size() == 3);
    assert(big.items[0] == "cand_a" && big.items[1] == "cand_b" && big.items[2] == "cand_c");
    assert(big.kept == "cand_a");
    assert(r1.report.components[1].items.size() == 1);
    assert(r1.report.components[1].kept == "cand_x");

    // edges carry exact similarity, 4dp, sorted by pool index
    assert(r1.report.edges.size() == 3);
    assert(r1.report.edges[0].source == "cand_b" && r1.report.edges[0].target == "cand_a");
    assert(r1.report.edges[1].source == "cand_b" && r1.report.edges[1].target == "cand_c");
    assert(r1.report.edges[2].source == "cand_a" && r1.report.edges[2].target == "cand_c");
    for (const auto& e : r1.report.edges) {
        assert(e.jaccard > 0.9 && e.jaccard <= 1.0);
        assert(e.jaccard == round4(e.jaccard));
    }

    // thread count does not change the output
    opt.max_threads = 4;
    const DedupResult r4 = resolve_duplicates(pool, cache, opt);
    assert(to_json(r4.report) == to_json(r1.report));

    // no pair above threshold => everything kept
    std::vector<Item> distinct = {make_unique_item("d1", "chat", Band::Short), make_unique_item("d2", "chat", Band::Short)};
    const DedupResult rd = resolve_duplicates(distinct, cache, opt);
    assert(rd.kept.size() == 2);
    assert(rd.report.edges.empty());

    // texts equal after normalization: front-matter, H2 line, entities,
    // tags, fenced code and platform literals do not count
    {
        const std::string plain = make_text("nz", 60);
        std::string body = plain;
        body.replace(body.find(" nzw30 "), 7, " &amp; <em>nzw30</em> ");
        const std::string noisy = "---\ntitle: draft\n---\n## Vision Notes\n" + body +
                                  "\n```js\nconst port = 3000;\n```\nreplit.toml 0.0.0.0\n";

        FingerprintCache nc;
        assert(nc.get(make_item("x1", "blog", Band::Standard, plain)).shingles ==
               nc.get(make_item("x2", "blog", Band::Standard, noisy)).shingles);

        std::vector<Item> same = {make_item("nrm_b", "blog", Band::Standard, plain),
                                  make_item("nrm_a", "blog", Band::Standard, noisy)};
        const DedupResult rn = resolve_duplicates(same, nc, opt);
        assert(rn.report.components.size() == 1);
        assert(rn.report.components[0].kept == "nrm_a");
        assert(rn.kept.size() == 1 && rn.kept[0].candidate_id == "nrm_a");
        assert(rn.dropped.size() == 1 && rn.dropped[0].candidate_id == "nrm_b");
        assert(rn.report.edges.size() == 1 && rn.report.edges[0].jaccard == 1.0);
    }

    // empty pool
    const DedupResult re = resolve_duplicates({}, cache, opt);
    assert(re.kept.empty() && re.report.components.empty());

    // duplicate candidate_id is rejected
    bool threw = false;
    try {
        std::vector<Item> bad = {pool[0], pool[0]};
        resolve_duplicates(bad, cache, opt);
    } catch (const GoldenException& e) {
        threw = e.code() == ErrorCode::InvalidArgs;
    }
    assert(threw);

    std::cout << "OK\n";
    return 0;
}
