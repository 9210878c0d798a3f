// Golden/cpp/include/golden/config.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "golden/format.h"
#include "golden/item.h"

namespace golden {

struct DeclaredStratum {
    StratumKey key;
    int count{5};
    std::string platform{"replit"};
};

struct ArchetypeKit {
    bool server{false};
    std::vector<std::string> pages;
    std::vector<std::string> features;
};

// (archetype, complexity) -> kit
using KitTable = std::map<std::pair<std::string, std::string>, ArchetypeKit>;

struct CurationConfig {
    // dedup
    double dedup_threshold{0.85};
    int num_perm{DEFAULT_NUM_PERM};
    uint64_t seed{DEFAULT_SEED};
    unsigned max_threads{16};

    // top-up
    int quota{5};
    int max_attempts{2};
    int oversub_factor{5};

    // diversity
    int max_swaps{5};
    int min_cluster_size{3};
    double max_gini{0.40};
    double shannon_threshold{0.97};

    // split caps
    int train_cap{42};
    int val_cap{14};
    int test_cap{14};

    // intake
    std::vector<std::string> archetypes{"blog", "guestbook", "chat", "notes", "dashboard", "store", "gallery"};
    std::vector<std::string> complexities{"MVP", "Pro"};
    std::vector<std::string> locales{"en"};
    std::string platform{"replit"};

    KitTable kits{default_kits()};

    // external synthesizer, empty => regeneration disabled
    std::string synthesizer_cmd;

    std::vector<DeclaredStratum> declared_strata() const;
    const ArchetypeKit* kit_for(const std::string& archetype, const std::string& complexity) const;

    static KitTable default_kits();
};

// Optional keys over defaults; unknown keys ignored; wrong type => InvalidConfig.
CurationConfig load_config_json(const std::filesystem::path& p);

// GOLDEN_THREADS, GOLDEN_SEED, GOLDEN_DEDUP_THRESHOLD
void apply_env_overrides(CurationConfig& cfg);

// Throws InvalidConfig: bad numbers, missing kit for a declared stratum.
void validate_config(const CurationConfig& cfg);

bool env_bool(const char* key, bool defv);
int64_t env_int(const char* key, int64_t defv);

} // namespace golden
