#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "golden/bands.h"
#include "golden/config.h"
#include "golden/errors.h"
#include "golden/io.h"
#include "golden/pipeline.h"
#include "golden/top_up.h"
#include "golden/validator.h"
#include "test_util.h"

using namespace golden;
namespace fs = std::filesystem;

static std::string slurp(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static std::vector<nlohmann::json> read_lines(const fs::path& p) {
    std::vector<nlohmann::json> out;
    std::ifstream in(p);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) out.push_back(nlohmann::json::parse(line));
    }
    return out;
}

// rep 1 SHORT, rep 5 EXTENDED, STANDARD between
static void add_stratum(std::vector<Item>& pool, const std::string& arch, const std::string& tags) {
    for (size_t i = 0; i < tags.size(); ++i) {
        pool.push_back(make_unique_item(arch + tags[i], arch, band_for_rep((int)i + 1)));
    }
}

static fs::path write_pool(const fs::path& dir, const std::vector<Item>& pool) {
    const fs::path p = dir / "candidates.jsonl";
    write_items_jsonl(p, pool);
    return p;
}

int main() {
    const CurationConfig cfg = load_config_json(test_data_file("config_small.json"));
    const BandValidator validator;
    const auto dir = mk_tmp_dir("pipeline");

    // blog: 4 distinct + one near-duplicate of bloga, notes: 5 distinct
    std::vector<Item> pool;
    add_stratum(pool, "blog", "abcd");
    {
        std::string text = make_text("bloga", 299) + " tail";
        pool.push_back(make_item("blogz", "blog", Band::Short, text));
    }
    add_stratum(pool, "notes", "abcde");
    {
        // invalid: declared SHORT, text is STANDARD
        Item bad = make_unique_item("notesx", "notes", Band::Standard);
        bad.length_band = Band::Short;
        pool.push_back(bad);
    }
    const fs::path input = write_pool(dir, pool);

    const fs::path out1 = dir / "run1";
    const PipelineSummary s1 = run_pipeline(cfg, input, out1, nullptr, validator);

    assert(s1.input == 11);
    assert(s1.rejected == 1);
    assert(s1.validated == 10);
    assert(s1.deduped == 9);
    assert(s1.topped == 10);
    assert(s1.quota_ok);
    assert(s1.train == 6 && s1.val == 2 && s1.test == 2);
    assert(s1.splits_digest.size() == 64);

    for (const char* f : {"validated.jsonl", "deduped.jsonl", "dedup_report.json", "topped.jsonl",
                          "top_up_trace.json", "diversity_report.json", "curated.jsonl", "band_report.json",
                          "splits.json", "train.jsonl", "val.jsonl", "test.jsonl", "golden.jsonl",
                          "golden.lock.json"}) {
        if (!fs::exists(out1 / f)) {
            std::cerr << "missing artifact " << f << "\n";
            assert(false);
        }
    }

    // the near-duplicate was dropped, then restored by top-up
    const auto dedup = read_json_file(out1 / "dedup_report.json");
    assert(dedup["components"].size() == 9);
    bool pair_found = false;
    for (const auto& c : dedup["components"]) {
        if (c["items"].size() == 2) {
            assert(c["items"][0] == "bloga" && c["items"][1] == "blogz");
            assert(c["kept"] == "bloga");
            pair_found = true;
        }
    }
    assert(pair_found);
    const auto trace = read_json_file(out1 / "top_up_trace.json");
    bool restored = false;
    bool blog_mix = false;
    for (const auto& e : trace) {
        if (e.value("candidate_id", "") == "blogz" && e["reason"] == "top_up" && e["selected"] == true) {
            assert(e["message"] == "near-duplicate of a kept item restored");
            restored = true;
        }
        if (e["reason"] == "band_mix") {
            assert(e["stratum"] == "blog-MVP-en");
            blog_mix = true;
        }
    }
    assert(restored);
    // blog ends with two SHORT items and no EXTENDED one
    assert(blog_mix);
    assert(!s1.strata_band_mix_ok);

    const auto golden_rows = read_lines(out1 / "golden.jsonl");
    assert(golden_rows.size() == 10);
    std::set<std::string> ids;
    for (const auto& r : golden_rows) {
        assert(r.contains("id") && r.contains("split"));
        assert(!r.contains("candidate_id"));
        assert(r["id"] == r["slot_id"]);
        ids.insert(r["id"].get<std::string>());
    }
    assert(ids.size() == 10);
    assert(ids.count("golden_blogMVPen_replit_rep05_seq005"));
    assert(ids.count("golden_notesMVPen_replit_rep01_seq006"));
    for (size_t i = 1; i < golden_rows.size(); ++i) {
        assert(golden_rows[i - 1]["id"].get<std::string>() < golden_rows[i]["id"].get<std::string>());
    }
    assert(read_lines(out1 / "train.jsonl").size() == 6);
    assert(read_lines(out1 / "val.jsonl").size() == 2);
    assert(read_lines(out1 / "test.jsonl").size() == 2);

    const auto splits = read_json_file(out1 / "splits.json");
    assert(splits["digest"] == s1.splits_digest);
    assert(splits["counts"]["train"] == 6);

    const auto lock = read_json_file(out1 / "golden.lock.json");
    assert(lock["artifacts"].size() == 4);
    assert(lock["reports"].size() == 4);
    std::string hex, err;
    assert(file_sha256(out1 / "golden.jsonl", hex, &err));
    assert(lock["artifacts"]["golden.jsonl"] == hex);

    // deterministic rerun
    const fs::path out2 = dir / "run2";
    const PipelineSummary s2 = run_pipeline(cfg, input, out2, nullptr, validator);
    assert(s2.splits_digest == s1.splits_digest);
    assert(slurp(out1 / "golden.jsonl") == slurp(out2 / "golden.jsonl"));
    assert(slurp(out1 / "golden.lock.json") == slurp(out2 / "golden.lock.json"));

    // notes short by two, no synthesizer => quota unmet
    {
        std::vector<Item> small;
        add_stratum(small, "blog", "abcde");
        add_stratum(small, "notes", "abc");
        const fs::path in3 = dir / "short";
        fs::create_directories(in3);
        const fs::path out3 = dir / "run3";

        bool unmet = false;
        try {
            run_pipeline(cfg, write_pool(in3, small), out3, nullptr, validator);
        } catch (const QuotaUnmetError& e) {
            unmet = e.stratum().str() == "notes-MVP-en" && e.have() == 3 && e.need() == 5;
        }
        assert(unmet);
        assert(fs::exists(out3 / "top_up_trace.json"));
        assert(!fs::exists(out3 / "golden.jsonl"));

        const auto t = read_json_file(out3 / "top_up_trace.json");
        bool pool_empty = false;
        for (const auto& e : t) {
            if (e["stratum"] == "notes-MVP-en" && e["reason"] == "pool_empty") pool_empty = true;
        }
        assert(pool_empty);
    }

    std::cout << "OK\n";
    return 0;
}
