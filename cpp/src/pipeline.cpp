// Golden/cpp/src/pipeline.cpp
#include "golden/pipeline.h"
#include "golden/bands.h"
#include "golden/dedup.h"
#include "golden/diversity.h"
#include "golden/errors.h"
#include "golden/io.h"
#include "golden/similarity.h"
#include "golden/top_up.h"

#include <algorithm>
#include <iostream>
#include <map>
#include <set>

using json = nlohmann::json;

namespace golden {

namespace fs = std::filesystem;

static const char* pass_fail(bool ok) { return ok ? "PASS" : "FAIL"; }

json to_json(const PipelineSummary& s) {
    json j;
    j["input"] = s.input;
    j["validated"] = s.validated;
    j["rejected"] = s.rejected;
    j["deduped"] = s.deduped;
    j["topped"] = s.topped;
    j["swaps"] = s.swaps;
    j["counts"] = json{{"train", s.train}, {"val", s.val}, {"test", s.test}};
    j["quota_ok"] = s.quota_ok;
    j["strata_band_mix_ok"] = s.strata_band_mix_ok;
    j["cluster_diverse"] = s.cluster_diverse;
    j["shannon_diverse"] = s.shannon_diverse;
    j["band_mix_ok"] = s.band_mix_ok;
    j["splits_digest"] = s.splits_digest;
    return j;
}

PackagedSplits package_items(const std::vector<Item>& items, const SplitAssignment& a) {
    std::map<std::string, const Item*> by_slot;
    for (const auto& it : items) by_slot[it.slot_id] = &it;

    PackagedSplits out;
    std::set<std::string> covered;
    for (int s = 0; s < 3; ++s) {
        for (const auto& sid : a.splits[(size_t)s]) {
            auto f = by_slot.find(sid);
            if (f == by_slot.end()) {
                std::cerr << "PKG_ERR: slot id " << sid << " not found in items\n";
                throw GoldenException(ErrorCode::ValidationFailed, "PKG_ERR: slot id not found: " + sid);
            }
            if (!covered.insert(sid).second) {
                throw GoldenException(ErrorCode::ValidationFailed, "PKG_ERR: slot id in more than one split: " + sid);
            }
            json j = item_to_json(*f->second);
            j["id"] = f->second->slot_id;
            j["split"] = kSplitNames[s];
            if (!j.contains("source_candidate_id")) j["source_candidate_id"] = f->second->candidate_id;
            j.erase("candidate_id");
            out.splits[(size_t)s].push_back(std::move(j));
        }
    }
    if (covered.size() != by_slot.size()) {
        throw GoldenException(ErrorCode::ValidationFailed,
                              "PKG_ERR: " + std::to_string(by_slot.size() - covered.size()) + " items not assigned to any split");
    }

    auto by_id = [](const json& x, const json& y) { return x["id"].get<std::string>() < y["id"].get<std::string>(); };
    for (auto& v : out.splits) {
        std::sort(v.begin(), v.end(), by_id);
        out.all.insert(out.all.end(), v.begin(), v.end());
    }
    std::sort(out.all.begin(), out.all.end(), by_id);
    return out;
}

static void lock_entry(json& dst, const fs::path& p) {
    std::string hex, err;
    if (!file_sha256(p, hex, &err)) throw GoldenException(ErrorCode::IoError, err);
    dst[p.filename().string()] = hex;
}

PipelineSummary run_pipeline(const CurationConfig& cfg,
                             const fs::path& input_jsonl,
                             const fs::path& out_dir,
                             Synthesizer* synth,
                             const Validator& validator) {
    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) throw GoldenException(ErrorCode::IoError, "cannot create out dir: " + out_dir.string() + " err=" + ec.message());

    PipelineSummary sum;
    FingerprintCache cache(cfg.num_perm, cfg.seed);

    // validate (bands classified here)
    const std::vector<Item> input = read_items_jsonl(input_jsonl);
    sum.input = input.size();

    std::vector<Item> validated;
    for (const auto& it : input) {
        ValidationOutcome vo = validator.validate(it);
        if (vo.accepted) {
            validated.push_back(std::move(vo.corrected));
            continue;
        }
        ++sum.rejected;
        std::cerr << "[golden.validate] invalid item " << it.candidate_id << ":\n";
        for (const auto& d : vo.diagnostics) std::cerr << "  - " << d << "\n";
    }
    sum.validated = validated.size();
    write_items_jsonl(out_dir / "validated.jsonl", validated);
    std::cout << "[golden] validate: in=" << sum.input << " valid=" << sum.validated
              << " invalid=" << sum.rejected << "\n";

    // dedup
    DedupOptions dopt;
    dopt.threshold = cfg.dedup_threshold;
    dopt.max_threads = cfg.max_threads;
    const DedupResult dr = resolve_duplicates(validated, cache, dopt);
    sum.deduped = dr.kept.size();
    write_items_jsonl(out_dir / "deduped.jsonl", dr.kept);
    write_json_canonical(out_dir / "dedup_report.json", to_json(dr.report));
    std::cout << "[golden] dedup: in=" << validated.size() << " kept=" << dr.kept.size()
              << " dropped=" << dr.dropped.size() << " edges=" << dr.report.edges.size() << "\n";

    // top-up
    TopUpOptions topt;
    topt.quota = cfg.quota;
    topt.max_attempts = cfg.max_attempts;
    topt.oversub_factor = cfg.oversub_factor;
    topt.base_seed = cfg.seed;
    topt.dedup = dopt;

    TopUpResult tr;
    try {
        tr = top_up(validated, dr.kept, cfg.declared_strata(), cache, synth, &validator, &cfg.kits, topt);
    } catch (const QuotaUnmetError& e) {
        write_json_canonical(out_dir / "top_up_trace.json", to_json(e.trace()));
        std::cout << "[golden] top_up: quota " << pass_fail(false) << " (" << e.stratum().str() << ")\n";
        throw;
    }
    sum.topped = tr.items.size();
    sum.quota_ok = true;
    sum.strata_band_mix_ok = tr.band_mix_breaches.empty();
    write_items_jsonl(out_dir / "topped.jsonl", tr.items);
    write_json_canonical(out_dir / "top_up_trace.json", to_json(tr.trace));
    std::cout << "[golden] top_up: items=" << tr.items.size() << " trace=" << tr.trace.size()
              << " regenerated=" << tr.regenerated.size() << " quota " << pass_fail(true)
              << " band mix " << pass_fail(sum.strata_band_mix_ok) << "\n";

    // diversity
    std::vector<Item> superset = validated;
    superset.insert(superset.end(), tr.regenerated.begin(), tr.regenerated.end());

    DiversityOptions vopt;
    vopt.max_swaps = cfg.max_swaps;
    vopt.min_cluster_size = cfg.min_cluster_size;
    vopt.max_gini = cfg.max_gini;
    vopt.shannon_threshold = cfg.shannon_threshold;
    vopt.kmeans.seed = (uint32_t)cfg.seed;
    const DiversityResult div = enforce_diversity(tr.items, superset, cache, vopt);
    sum.swaps = div.swaps.size();
    sum.cluster_diverse = div.cluster.is_diverse;
    sum.shannon_diverse = div.shannon.is_diverse;
    write_json_canonical(out_dir / "diversity_report.json", to_json(div));
    write_items_jsonl(out_dir / "curated.jsonl", div.items);
    std::cout << "[golden] diversity: swaps=" << div.swaps.size() << " gini=" << div.cluster.gini
              << " cluster " << pass_fail(div.cluster.is_diverse)
              << " shannon " << pass_fail(div.shannon.is_diverse) << "\n";
    if (!div.cluster.is_diverse) std::cerr << "[golden] WARNING: cluster diversity not reached, continuing\n";

    // bands
    const json br = band_report(div.items);
    sum.band_mix_ok = br["is_valid"].get<bool>();
    write_json_canonical(out_dir / "band_report.json", br);
    std::cout << "[golden] bands: SHORT=" << br["distribution"]["SHORT"] << " STANDARD=" << br["distribution"]["STANDARD"]
              << " EXTENDED=" << br["distribution"]["EXTENDED"] << " mix " << pass_fail(sum.band_mix_ok) << "\n";
    if (!sum.band_mix_ok) {
        std::cerr << "[golden] WARNING: band distribution does not meet global targets, continuing\n";
        for (const auto& s : br["suggestions"]) {
            std::cerr << "  " << s["slot_id"].get<std::string>() << ": " << s["current_band"].get<std::string>()
                      << " -> " << s["suggested_band"].get<std::string>() << "\n";
        }
    }

    // split
    SplitCaps caps;
    caps.train = cfg.train_cap;
    caps.val = cfg.val_cap;
    caps.test = cfg.test_cap;
    const SplitAssignment sa = split_stratified(div.items, caps);
    sum.train = sa.train().size();
    sum.val = sa.val().size();
    sum.test = sa.test().size();
    sum.splits_digest = sa.digest;
    write_json_canonical(out_dir / "splits.json", to_json(sa));
    const bool caps_ok = (int)sum.train <= caps.train && (int)sum.val <= caps.val && (int)sum.test <= caps.test;
    std::cout << "[golden] split: train=" << sum.train << " val=" << sum.val << " test=" << sum.test
              << " caps " << pass_fail(caps_ok) << " digest=" << sa.digest << "\n";

    // package
    const PackagedSplits pk = package_items(div.items, sa);
    write_json_lines(out_dir / "train.jsonl", pk.splits[0]);
    write_json_lines(out_dir / "val.jsonl", pk.splits[1]);
    write_json_lines(out_dir / "test.jsonl", pk.splits[2]);
    write_json_lines(out_dir / "golden.jsonl", pk.all);
    std::cout << "[golden] package: total=" << pk.all.size() << "\n";

    json lock;
    lock["reports"] = json::object();
    lock["splits"] = json::object();
    lock["artifacts"] = json::object();
    for (const char* r : {"dedup_report.json", "diversity_report.json", "top_up_trace.json", "band_report.json"}) {
        lock_entry(lock["reports"], out_dir / r);
    }
    lock_entry(lock["splits"], out_dir / "splits.json");
    for (const char* a : {"train.jsonl", "val.jsonl", "test.jsonl", "golden.jsonl"}) {
        lock_entry(lock["artifacts"], out_dir / a);
    }
    write_json_canonical(out_dir / "golden.lock.json", lock);

    return sum;
}

} // namespace golden
