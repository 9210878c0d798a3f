// Golden/cpp/src/top_up.cpp
#include "golden/top_up.h"
#include "golden/bands.h"
#include "golden/format.h"

#include <algorithm>
#include <iostream>
#include <map>
#include <set>
#include <unordered_set>

namespace golden {

QuotaUnmetError::QuotaUnmetError(StratumKey stratum, int have, int need, std::vector<TopUpTraceEntry> trace)
    : GoldenException(ErrorCode::QuotaUnmet,
                      "TOPUP_ERR: failed to top up stratum " + stratum.str() + " to " + std::to_string(need) +
                      " items (have " + std::to_string(have) + ")"),
      stratum_(std::move(stratum)), have_(have), need_(need), trace_(std::move(trace)) {}

namespace {

struct Scored {
    const Item* item;
    double score;
};

void sort_scored(std::vector<Scored>& v) {
    std::sort(v.begin(), v.end(), [](const Scored& a, const Scored& b) {
        if (a.score != b.score) return a.score < b.score;
        return a.item->candidate_id < b.item->candidate_id;
    });
}

std::map<Band, int> band_scheme(int quota) {
    std::map<Band, int> s;
    for (Band b : kAllBands) s[b] = 0;
    for (int rep = 1; rep <= quota; ++rep) s[band_for_rep(rep)] += 1;
    return s;
}

// first band of the canonical scheme still missing from `have`
Band missing_band(const std::vector<Item>& have, int quota) {
    std::map<Band, int> need = band_scheme(quota);
    for (const auto& it : have) need[it.length_band] -= 1;
    for (Band b : kAllBands) {
        if (need[b] > 0) return b;
    }
    return Band::Standard;
}

std::map<Band, int> open_bands(const std::vector<Item>& have, int quota) {
    std::map<Band, int> open = band_scheme(quota);
    for (const auto& it : have) open[it.length_band] -= 1;
    return open;
}

// `needed` picks from `v` (already in (score, id) order): bands still open in
// the canonical scheme first, then the rest in order.
std::vector<char> pick_for_bands(const std::vector<Scored>& v, std::map<Band, int> open, int needed) {
    std::vector<char> pick(v.size(), 0);
    int taken = 0;
    for (size_t i = 0; i < v.size() && taken < needed; ++i) {
        const Band b = v[i].item->length_band;
        if (open[b] > 0) {
            open[b] -= 1;
            pick[i] = 1;
            ++taken;
        }
    }
    for (size_t i = 0; i < v.size() && taken < needed; ++i) {
        if (!pick[i]) { pick[i] = 1; ++taken; }
    }
    return pick;
}

std::string mix_str(const std::map<Band, int>& m) {
    std::string s;
    for (Band b : kAllBands) {
        auto it = m.find(b);
        if (!s.empty()) s.push_back(' ');
        s += std::string(band_name(b)) + "=" + std::to_string(it == m.end() ? 0 : it->second);
    }
    return s;
}

std::vector<Item> in_stratum(const std::vector<Item>& items, const StratumKey& key) {
    std::vector<Item> out;
    for (const auto& it : items) {
        if (it.stratum() == key) out.push_back(it);
    }
    return out;
}

std::vector<const Item*> ptrs(const std::vector<Item>& v) {
    std::vector<const Item*> out;
    out.reserve(v.size());
    for (const auto& it : v) out.push_back(&it);
    return out;
}

} // namespace

TopUpResult top_up(const std::vector<Item>& pre_dedup,
                   const std::vector<Item>& kept,
                   const std::vector<DeclaredStratum>& declared,
                   FingerprintCache& cache,
                   Synthesizer* synth,
                   const Validator* validator,
                   const KitTable* kits,
                   const TopUpOptions& opt) {
    std::unordered_set<std::string> seen_ids;
    for (const auto& it : pre_dedup) {
        if (!seen_ids.insert(it.candidate_id).second) {
            throw GoldenException(ErrorCode::InvalidArgs, "duplicate candidate_id in pool: " + it.candidate_id);
        }
    }
    for (const auto& it : kept) seen_ids.insert(it.candidate_id);

    // stratum -> (quota, platform name)
    std::map<StratumKey, std::pair<int, std::string>> strata;
    for (const auto& ds : declared) strata[ds.key] = {ds.count, ds.platform};
    for (const auto& it : pre_dedup) {
        if (!strata.count(it.stratum())) strata[it.stratum()] = {opt.quota, it.platform.name};
    }
    for (const auto& it : kept) {
        if (!strata.count(it.stratum())) strata[it.stratum()] = {opt.quota, it.platform.name};
    }

    TopUpResult res;
    std::vector<Item> all_kept = kept;
    auto& trace = res.trace;

    for (const auto& kv : strata) {
        const StratumKey& key = kv.first;
        const int quota = kv.second.first;
        const std::string& platform_name = kv.second.second;
        const std::string skey = key.str();

        std::vector<Item> mine = in_stratum(all_kept, key);

        if ((int)mine.size() > quota) {
            std::sort(mine.begin(), mine.end(), [](const Item& a, const Item& b) { return a.candidate_id < b.candidate_id; });
            std::map<Band, int> room = band_scheme(quota);
            std::vector<char> take(mine.size(), 0);
            int taken = 0;
            for (size_t i = 0; i < mine.size() && taken < quota; ++i) {
                if (room[mine[i].length_band] > 0) {
                    room[mine[i].length_band] -= 1;
                    take[i] = 1;
                    ++taken;
                }
            }
            for (size_t i = 0; i < mine.size() && taken < quota; ++i) {
                if (!take[i]) { take[i] = 1; ++taken; }
            }

            std::set<std::string> drop;
            for (size_t i = 0; i < mine.size(); ++i) {
                if (take[i]) continue;
                drop.insert(mine[i].candidate_id);
                TopUpTraceEntry e;
                e.stratum = skey;
                e.candidate_id = mine[i].candidate_id;
                e.selected = false;
                e.reason = "over_quota";
                trace.push_back(e);
            }
            all_kept.erase(std::remove_if(all_kept.begin(), all_kept.end(),
                                          [&](const Item& it) { return drop.count(it.candidate_id) > 0; }),
                           all_kept.end());
            std::cerr << "[golden.top_up] " << skey << ": trimmed " << drop.size() << " over quota\n";
            continue;
        }
        if ((int)mine.size() == quota) continue;

        // 1. dropped candidates of this stratum
        std::set<std::string> kept_ids;
        for (const auto& it : mine) kept_ids.insert(it.candidate_id);

        std::vector<Scored> cands;
        const auto mine_ptrs = ptrs(mine);
        for (const auto& it : pre_dedup) {
            if (it.stratum() != key || kept_ids.count(it.candidate_id)) continue;
            cands.push_back(Scored{&it, max_exact_jaccard(it, mine_ptrs, cache)});
        }
        sort_scored(cands);

        const int needed = quota - (int)mine.size();
        const std::vector<char> pick = pick_for_bands(cands, open_bands(mine, quota), needed);
        int selected = 0;
        for (size_t i = 0; i < cands.size(); ++i) {
            const Scored& c = cands[i];
            TopUpTraceEntry e;
            e.stratum = skey;
            e.candidate_id = c.item->candidate_id;
            e.max_jaccard = round4(c.score);
            if (pick[i]) {
                e.selected = true;
                e.reason = "top_up";
                if (c.score >= opt.dedup.threshold) {
                    e.message = "near-duplicate of a kept item restored";
                    std::cerr << "[golden.top_up] WARNING: " << skey << ": " << c.item->candidate_id
                              << " restored with max_jaccard " << round4(c.score) << " >= " << opt.dedup.threshold << "\n";
                }
                all_kept.push_back(*c.item);
                ++selected;
            } else {
                e.selected = false;
                e.reason = "not_needed";
            }
            trace.push_back(e);
        }
        if (selected >= needed) continue;

        {
            TopUpTraceEntry e;
            e.stratum = skey;
            e.reason = "pool_empty";
            e.message = "need to regenerate " + std::to_string(needed - selected) + " items";
            trace.push_back(e);
        }

        // 2. bounded regeneration
        int have = (int)in_stratum(all_kept, key).size();
        for (int attempt = 1; attempt <= opt.max_attempts && have < quota; ++attempt) {
            if (!synth) break;

            const std::vector<Item> current = in_stratum(all_kept, key);

            Slot slot;
            slot.archetype = key.archetype;
            slot.complexity = key.complexity;
            slot.locale = key.locale;
            slot.rep = 1;
            slot.seq = 1;
            slot.slot_id = make_slot_id(key, platform_name, 1, 1);
            slot.target_band = missing_band(current, quota);
            slot.platform.name = platform_name;
            if (kits) {
                auto kit = kits->find({key.archetype, key.complexity});
                if (kit != kits->end()) {
                    slot.pages = kit->second.pages;
                    slot.features = kit->second.features;
                    if (kit->second.server) {
                        slot.platform.server = true;
                        slot.platform.bind = std::string("0.0.0.0");
                    }
                }
            }

            const uint64_t seed = regeneration_seed(opt.base_seed, key.archetype, key.complexity, attempt);

            std::vector<Item> generated;
            try {
                generated = synth->synthesize(slot, opt.oversub_factor, seed);
            } catch (const GoldenException& ex) {
                if (ex.code() != ErrorCode::SynthesisFailed) throw;
                std::cerr << "TOPUP_ERR: " << skey << " attempt " << attempt << ": " << ex.what() << "\n";
                TopUpTraceEntry e;
                e.stratum = skey;
                e.reason = "synthesis_failed";
                e.attempt = attempt;
                e.message = ex.what();
                trace.push_back(e);
                continue;
            }

            std::vector<Item> fresh;
            for (const auto& g : generated) {
                TopUpTraceEntry e;
                e.stratum = skey;
                e.candidate_id = g.candidate_id;
                e.attempt = attempt;
                e.selected = false;

                if (g.stratum() != key) {
                    e.reason = "rejected_by_validator";
                    e.message = "candidate belongs to stratum " + g.stratum().str();
                    trace.push_back(e);
                    continue;
                }
                if (seen_ids.count(g.candidate_id)) {
                    e.reason = "duplicate_id";
                    trace.push_back(e);
                    continue;
                }
                seen_ids.insert(g.candidate_id);

                Item accepted = g;
                if (validator) {
                    ValidationOutcome vo = validator->validate(g);
                    if (!vo.accepted) {
                        e.reason = "rejected_by_validator";
                        for (const auto& d : vo.diagnostics) e.message += (e.message.empty() ? "" : "; ") + d;
                        trace.push_back(e);
                        continue;
                    }
                    accepted = vo.corrected;
                }
                res.regenerated.push_back(accepted);
                fresh.push_back(std::move(accepted));
            }

            // only components with no already-kept member yield novel items
            std::vector<Item> combined = all_kept;
            combined.insert(combined.end(), fresh.begin(), fresh.end());
            const DedupResult dr = resolve_duplicates(combined, cache, opt.dedup);

            std::set<std::string> kept_now;
            for (const auto& it : all_kept) kept_now.insert(it.candidate_id);

            std::set<std::string> novel_ids;
            for (const auto& comp : dr.report.components) {
                bool touches_kept = false;
                for (const auto& id : comp.items) {
                    if (kept_now.count(id)) { touches_kept = true; break; }
                }
                if (!touches_kept) novel_ids.insert(comp.kept);
            }

            const std::vector<Item> stratum_now = in_stratum(all_kept, key);
            const auto stratum_ptrs = ptrs(stratum_now);
            std::vector<Scored> novel;
            std::map<std::string, double> score_of;
            for (const auto& f : fresh) {
                const double s = max_exact_jaccard(f, stratum_ptrs, cache);
                score_of[f.candidate_id] = s;
                if (novel_ids.count(f.candidate_id)) novel.push_back(Scored{&f, s});
            }
            sort_scored(novel);

            std::set<std::string> admitted;
            const std::vector<char> take = pick_for_bands(novel, open_bands(stratum_now, quota), quota - have);
            for (size_t i = 0; i < novel.size(); ++i) {
                if (!take[i]) continue;
                admitted.insert(novel[i].item->candidate_id);
                all_kept.push_back(*novel[i].item);
                ++have;
            }

            for (const auto& f : fresh) {
                TopUpTraceEntry e;
                e.stratum = skey;
                e.candidate_id = f.candidate_id;
                e.max_jaccard = round4(score_of[f.candidate_id]);
                e.selected = admitted.count(f.candidate_id) > 0;
                e.reason = "regenerated";
                e.attempt = attempt;
                trace.push_back(e);
            }
            std::cerr << "[golden.top_up] " << skey << " attempt " << attempt << ": generated=" << generated.size()
                      << " valid=" << fresh.size() << " admitted=" << admitted.size() << "\n";
        }

        if (have < quota) {
            std::cerr << "TOPUP_ERR: failed to top up stratum " << skey << " to " << quota << " items\n";
            throw QuotaUnmetError(key, have, quota, trace);
        }
    }

    res.items = renumber_strata(std::move(all_kept));

    // realized per-stratum band mix against the canonical scheme
    for (const auto& kv : strata) {
        const std::map<Band, int> want = band_scheme(kv.second.first);
        std::map<Band, int> got;
        for (Band b : kAllBands) got[b] = 0;
        for (const auto& it : res.items) {
            if (it.stratum() == kv.first) got[it.length_band] += 1;
        }
        if (got == want) continue;

        const std::string skey = kv.first.str();
        TopUpTraceEntry e;
        e.stratum = skey;
        e.reason = "band_mix";
        e.message = "have " + mix_str(got) + ", want " + mix_str(want);
        trace.push_back(e);
        res.band_mix_breaches.push_back(skey);
        std::cerr << "[golden.top_up] WARNING: " << skey << " band mix " << e.message << "\n";
    }
    return res;
}

std::vector<Item> renumber_strata(std::vector<Item> items) {
    std::map<StratumKey, std::vector<Item>> by;
    for (auto& it : items) {
        StratumKey k = it.stratum();
        by[k].push_back(std::move(it));
    }

    std::vector<Item> out;
    out.reserve(items.size());
    int seq = 1;
    for (auto& kv : by) {
        auto& v = kv.second;
        std::sort(v.begin(), v.end(), [](const Item& a, const Item& b) { return a.candidate_id < b.candidate_id; });
        int rep = 1;
        for (auto& it : v) {
            it.rep = rep++;
            it.seq = seq++;
            it.slot_id = make_slot_id(kv.first, it.platform.name, it.rep, it.seq);
            if (it.source_candidate_id.empty()) it.source_candidate_id = it.candidate_id;
            out.push_back(std::move(it));
        }
    }
    return out;
}

nlohmann::json to_json(const std::vector<TopUpTraceEntry>& trace) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : trace) {
        nlohmann::json j;
        j["stratum"] = e.stratum;
        j["reason"] = e.reason;
        if (!e.candidate_id.empty()) j["candidate_id"] = e.candidate_id;
        if (e.max_jaccard) j["max_jaccard"] = *e.max_jaccard;
        if (e.selected) j["selected"] = *e.selected;
        if (e.attempt > 0) j["attempt"] = e.attempt;
        if (!e.message.empty()) j["message"] = e.message;
        arr.push_back(j);
    }
    return arr;
}

} // namespace golden
