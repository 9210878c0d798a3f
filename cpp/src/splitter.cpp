// Golden/cpp/src/splitter.cpp
#include "golden/splitter.h"
#include "golden/errors.h"
#include "golden/format.h"

#include <algorithm>
#include <iostream>
#include <map>
#include <unordered_set>

namespace golden {

nlohmann::json SplitAssignment::splits_json() const {
    nlohmann::json j;
    for (int s = 0; s < 3; ++s) j[kSplitNames[s]] = splits[(size_t)s];
    return j;
}

std::string split_digest(const nlohmann::json& splits) {
    return sha256_hex(splits.dump());
}

SplitAssignment split_stratified(const std::vector<Item>& items,
                                 const SplitCaps& caps,
                                 std::optional<uint64_t> seed) {
    if (seed) std::cerr << "WARN SPLIT_SEED_IGNORED " << *seed << "\n";

    std::unordered_set<std::string> seen;
    // band -> stratum -> items
    std::map<Band, std::map<StratumKey, std::vector<const Item*>>> groups;
    for (const auto& it : items) {
        if (!seen.insert(it.slot_id).second) {
            throw GoldenException(ErrorCode::InvalidArgs, "duplicate slot_id in split input: " + it.slot_id);
        }
        groups[it.length_band][it.stratum()].push_back(&it);
    }

    const int cap[3] = {caps.train, caps.val, caps.test};
    int used[3] = {0, 0, 0};
    int cursor = 0;

    SplitAssignment a;
    for (Band b : kAllBands) {
        auto bi = groups.find(b);
        if (bi == groups.end()) continue;
        for (auto& kv : bi->second) {
            auto& v = kv.second;
            std::sort(v.begin(), v.end(), [](const Item* x, const Item* y) { return x->slot_id < y->slot_id; });
            for (const Item* it : v) {
                int dst = -1;
                for (int step = 0; step < 3; ++step) {
                    const int s = (cursor + step) % 3;
                    if (used[s] < cap[s]) { dst = s; break; }
                }
                if (dst < 0) {
                    dst = 0;
                } else {
                    cursor = (dst + 1) % 3;
                }
                a.splits[(size_t)dst].push_back(it->slot_id);
                used[dst] += 1;
            }
        }
    }

    a.digest = split_digest(a.splits_json());
    return a;
}

nlohmann::json to_json(const SplitAssignment& a) {
    nlohmann::json j;
    j["splits"] = a.splits_json();
    for (int s = 0; s < 3; ++s) j["counts"][kSplitNames[s]] = a.splits[(size_t)s].size();
    j["digest"] = a.digest;
    return j;
}

} // namespace golden
