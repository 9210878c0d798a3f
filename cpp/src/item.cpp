// Golden/cpp/src/item.cpp
#include "golden/item.h"

#include <cstdio>

namespace golden {

const char* band_name(Band b) {
    switch (b) {
        case Band::Short:    return "SHORT";
        case Band::Standard: return "STANDARD";
        case Band::Extended: return "EXTENDED";
    }
    return "STANDARD";
}

std::optional<Band> parse_band(std::string_view s) {
    if (s == "SHORT") return Band::Short;
    if (s == "STANDARD") return Band::Standard;
    if (s == "EXTENDED") return Band::Extended;
    return std::nullopt;
}

std::string make_slot_id(const StratumKey& key, const std::string& platform, int rep, int seq) {
    char tail[48];
    std::snprintf(tail, sizeof(tail), "_rep%02d_seq%03d", rep, seq);
    return "golden_" + key.archetype + key.complexity + key.locale + "_" + platform + tail;
}

} // namespace golden
