// Golden/cpp/include/golden/splitter.h
#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "golden/item.h"

namespace golden {

struct SplitCaps {
    int train{42};
    int val{14};
    int test{14};
};

constexpr const char* kSplitNames[3] = {"train", "val", "test"};

struct SplitAssignment {
    std::array<std::vector<std::string>, 3> splits; // slot_ids, train/val/test
    std::string digest;                              // sha256 of splits_json().dump()

    const std::vector<std::string>& train() const { return splits[0]; }
    const std::vector<std::string>& val() const { return splits[1]; }
    const std::vector<std::string>& test() const { return splits[2]; }

    nlohmann::json splits_json() const;
};

// Band-major round robin over (band, stratum, slot_id) with a rotating
// cursor; an item goes to the first split at/after the cursor with room.
// All full => train. `seed` is accepted and ignored (SPLIT_SEED_IGNORED).
// Duplicate slot_id => InvalidArgs.
SplitAssignment split_stratified(const std::vector<Item>& items,
                                 const SplitCaps& caps = SplitCaps(),
                                 std::optional<uint64_t> seed = std::nullopt);

std::string split_digest(const nlohmann::json& splits);

// {splits, counts, digest}
nlohmann::json to_json(const SplitAssignment& a);

} // namespace golden
