#include <cassert>
#include <cstdlib>
#include <iostream>

#include "golden/config.h"
#include "golden/errors.h"
#include "test_util.h"

using namespace golden;

static bool throws_invalid_config(const char* file) {
    try {
        load_config_json(test_data_file(file));
    } catch (const GoldenException& e) {
        return e.code() == ErrorCode::InvalidConfig;
    }
    return false;
}

int main() {
    // defaults: 7 archetypes x 2 complexities, complete kit table
    CurationConfig def;
    validate_config(def);
    const auto strata = def.declared_strata();
    assert(strata.size() == 14);
    assert(strata[0].key.str() == "blog-MVP-en");
    assert(strata[0].count == 5 && strata[0].platform == "replit");
    assert(def.kit_for("store", "Pro") != nullptr);
    assert(def.kit_for("store", "Ultra") == nullptr);
    assert(def.dedup_threshold == 0.85 && def.seed == 2025 && def.num_perm == 128);
    assert(def.train_cap == 42 && def.val_cap == 14 && def.test_cap == 14);

    CurationConfig cfg = load_config_json(test_data_file("config_small.json"));
    assert(cfg.dedup_threshold == 0.9);
    assert(cfg.max_threads == 2);
    assert(cfg.max_attempts == 1 && cfg.oversub_factor == 3);
    assert(cfg.max_swaps == 2);
    assert(cfg.train_cap == 6 && cfg.val_cap == 2 && cfg.test_cap == 2);
    assert(cfg.declared_strata().size() == 2);
    assert(cfg.kit_for("notes", "MVP")->server);
    assert(cfg.kit_for("blog", "MVP")->pages.size() == 2);
    assert(cfg.seed == 2025);

    assert(throws_invalid_config("config_missing_kit.json"));
    assert(throws_invalid_config("config_bad_type.json"));

    bool io = false;
    try {
        load_config_json(test_data_file("does_not_exist.json"));
    } catch (const GoldenException& e) {
        io = e.code() == ErrorCode::IoError;
    }
    assert(io);

    // env overrides
    setenv("GOLDEN_THREADS", "3", 1);
    setenv("GOLDEN_SEED", "77", 1);
    setenv("GOLDEN_DEDUP_THRESHOLD", "0.7", 1);
    apply_env_overrides(cfg);
    assert(cfg.max_threads == 3);
    assert(cfg.seed == 77);
    assert(cfg.dedup_threshold == 0.7);

    setenv("GOLDEN_DEDUP_THRESHOLD", "oops", 1);
    apply_env_overrides(cfg);
    assert(cfg.dedup_threshold == 0.7);

    setenv("GOLDEN_FLAG", "true", 1);
    assert(env_bool("GOLDEN_FLAG", false));
    assert(env_int("GOLDEN_UNSET_KEY", 9) == 9);

    std::cout << "OK\n";
    return 0;
}
