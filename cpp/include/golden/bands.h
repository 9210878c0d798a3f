// Golden/cpp/include/golden/bands.h
#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "golden/item.h"

namespace golden {

struct BandRange {
    int min_tokens;
    int max_tokens; // inclusive
};

struct BandTarget {
    int target;
    int tolerance;
};

BandRange band_range(Band b);
BandTarget global_target(Band b);

// H2 header lines and the "### Access Control" label do not count.
int count_tokens(const std::string& text);

// Inclusive ranges, SHORT 250-400, STANDARD 401-800, EXTENDED 601-1500.
// In the 601-800 overlap the narrowest range wins (STANDARD).
std::optional<Band> determine_band(int token_count);

// canonical per-stratum scheme: rep 1 SHORT, rep 5 EXTENDED, otherwise STANDARD
Band band_for_rep(int rep);

struct BandCheck {
    bool ok{false};
    int token_count{0};
    std::optional<Band> actual;   // correction when !ok and actual is set
    std::string error;
};

BandCheck validate_band(const Item& item);

using BandDistribution = std::map<Band, int>;

BandDistribution band_distribution(const std::vector<Item>& items);
bool validate_global_mix(const BandDistribution& d);

struct BandSuggestion {
    std::string slot_id;
    Band current;
    Band suggested;
};

// surplus items (by slot_id) moved from over-target to under-target bands
std::vector<BandSuggestion> suggest_band_adjustments(const std::vector<Item>& items);

nlohmann::json band_report(const std::vector<Item>& items);

} // namespace golden
