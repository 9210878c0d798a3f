// Golden/cpp/include/golden/item.h
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace golden {

// Ordered: SHORT < STANDARD < EXTENDED
enum class Band {
    Short = 0,
    Standard = 1,
    Extended = 2,
};

constexpr Band kAllBands[3] = {Band::Short, Band::Standard, Band::Extended};

const char* band_name(Band b);                         // "SHORT" / "STANDARD" / "EXTENDED"
std::optional<Band> parse_band(std::string_view s);

struct StratumKey {
    std::string archetype;
    std::string complexity;
    std::string locale;

    std::string str() const { return archetype + "-" + complexity + "-" + locale; }

    bool operator<(const StratumKey& o) const {
        return std::tie(archetype, complexity, locale) < std::tie(o.archetype, o.complexity, o.locale);
    }
    bool operator==(const StratumKey& o) const {
        return archetype == o.archetype && complexity == o.complexity && locale == o.locale;
    }
    bool operator!=(const StratumKey& o) const { return !(*this == o); }
};

struct Platform {
    std::string name{"replit"};
    bool server{false};
    std::optional<std::string> bind; // null for non-server specs
};

struct Item {
    std::string candidate_id;         // unique per candidate (slot_id + "__vNN")
    std::string slot_id;              // logical request
    std::string archetype;
    std::string complexity;
    std::string locale;
    int rep{0};
    int seq{0};
    Band length_band{Band::Standard};
    Platform platform;
    std::string spec;                 // raw text body
    std::string source_candidate_id;  // provenance, empty => not stamped yet

    StratumKey stratum() const { return StratumKey{archetype, complexity, locale}; }
};

// "golden_{archetype}{complexity}{locale}_{platform}_rep{RR}_seq{SSS}"
std::string make_slot_id(const StratumKey& key, const std::string& platform, int rep, int seq);

} // namespace golden
