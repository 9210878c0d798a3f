// Golden/cpp/src/bands.cpp
#include "golden/bands.h"

#include <algorithm>
#include <cstdlib>

#include "text_common.h"

namespace golden {

BandRange band_range(Band b) {
    switch (b) {
        case Band::Short: return BandRange{250, 400};
        case Band::Standard: return BandRange{401, 800};
        case Band::Extended: return BandRange{601, 1500};
    }
    return BandRange{0, -1};
}

BandTarget global_target(Band b) {
    switch (b) {
        case Band::Short: return BandTarget{14, 7};
        case Band::Standard: return BandTarget{42, 7};
        case Band::Extended: return BandTarget{14, 7};
    }
    return BandTarget{0, 0};
}

int count_tokens(const std::string& text) {
    std::string t = strip_h2_headers(text);
    t = strip_literals(t, {"### Access Control"});
    return (int)tokenize_words(t).size();
}

std::optional<Band> determine_band(int token_count) {
    std::optional<Band> best;
    int best_width = 0;
    for (Band b : kAllBands) {
        const BandRange r = band_range(b);
        if (token_count < r.min_tokens || token_count > r.max_tokens) continue;
        const int w = r.max_tokens - r.min_tokens;
        if (!best || w < best_width) {
            best = b;
            best_width = w;
        }
    }
    return best;
}

Band band_for_rep(int rep) {
    if (rep == 1) return Band::Short;
    if (rep == 5) return Band::Extended;
    return Band::Standard;
}

BandCheck validate_band(const Item& item) {
    BandCheck c;
    c.token_count = count_tokens(item.spec);
    c.actual = determine_band(c.token_count);
    if (!c.actual) {
        c.error = "token count " + std::to_string(c.token_count) + " does not fall into any band";
        return c;
    }
    if (*c.actual != item.length_band) {
        c.error = std::string("declared band ") + band_name(item.length_band) +
                  " does not match actual band " + band_name(*c.actual) +
                  " (token count: " + std::to_string(c.token_count) + ")";
        return c;
    }
    c.ok = true;
    return c;
}

BandDistribution band_distribution(const std::vector<Item>& items) {
    BandDistribution d;
    for (Band b : kAllBands) d[b] = 0;
    for (const auto& it : items) d[it.length_band] += 1;
    return d;
}

bool validate_global_mix(const BandDistribution& d) {
    for (Band b : kAllBands) {
        const BandTarget t = global_target(b);
        auto it = d.find(b);
        const int cnt = it == d.end() ? 0 : it->second;
        if (std::abs(cnt - t.target) > t.tolerance) return false;
    }
    return true;
}

std::vector<BandSuggestion> suggest_band_adjustments(const std::vector<Item>& items) {
    const BandDistribution d = band_distribution(items);
    std::map<Band, int> delta;
    for (Band b : kAllBands) delta[b] = d.at(b) - global_target(b).target;

    std::vector<BandSuggestion> out;
    for (Band reduce : kAllBands) {
        if (delta[reduce] <= 0) continue;

        std::vector<const Item*> cands;
        for (const auto& it : items) {
            if (it.length_band == reduce) cands.push_back(&it);
        }
        std::sort(cands.begin(), cands.end(), [](const Item* a, const Item* b) { return a->slot_id < b->slot_id; });

        for (Band grow : kAllBands) {
            if (delta[grow] >= 0) continue;
            const int move = std::min(delta[reduce], -delta[grow]);
            if (move <= 0) continue;
            // each pass restarts at the head of the candidate list
            for (int i = 0; i < move && i < (int)cands.size(); ++i) {
                out.push_back(BandSuggestion{cands[(size_t)i]->slot_id, reduce, grow});
            }
            delta[reduce] -= move;
            delta[grow] += move;
        }
    }
    return out;
}

nlohmann::json band_report(const std::vector<Item>& items) {
    using json = nlohmann::json;
    const BandDistribution d = band_distribution(items);
    const bool ok = validate_global_mix(d);

    json j;
    for (Band b : kAllBands) {
        const BandRange r = band_range(b);
        const BandTarget t = global_target(b);
        j["band_ranges"][band_name(b)] = json{{"min", r.min_tokens}, {"max", r.max_tokens}};
        j["global_targets"][band_name(b)] = json{{"target", t.target}, {"tolerance", t.tolerance}};
        j["distribution"][band_name(b)] = d.at(b);
    }
    j["is_valid"] = ok;
    j["suggestions"] = json::array();
    if (!ok) {
        for (const auto& s : suggest_band_adjustments(items)) {
            j["suggestions"].push_back(json{{"slot_id", s.slot_id},
                                            {"current_band", band_name(s.current)},
                                            {"suggested_band", band_name(s.suggested)}});
        }
    }
    return j;
}

} // namespace golden
