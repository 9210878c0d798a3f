// Golden/cpp/src/config.cpp
#include "golden/config.h"
#include "golden/errors.h"
#include "golden/io.h"

#include <cstdlib>
#include <cstring>
#include <iostream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace golden {

bool env_bool(const char* key, bool defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    if (std::strcmp(s, "1") == 0) return true;
    if (std::strcmp(s, "0") == 0) return false;
    if (std::strcmp(s, "true") == 0 || std::strcmp(s, "TRUE") == 0) return true;
    if (std::strcmp(s, "false") == 0 || std::strcmp(s, "FALSE") == 0) return false;
    return defv;
}

int64_t env_int(const char* key, int64_t defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    char* end = nullptr;
    const long long v = std::strtoll(s, &end, 10);
    if (end == s || *end != '\0') {
        std::cerr << "[golden] ignoring non-integer " << key << "=" << s << "\n";
        return defv;
    }
    return (int64_t)v;
}

KitTable CurationConfig::default_kits() {
    KitTable t;
    auto put = [&](const char* a, bool mvp_server, bool pro_server,
                   std::vector<std::string> pages, std::vector<std::string> features) {
        ArchetypeKit mvp{mvp_server, pages, features};
        ArchetypeKit pro{pro_server, pages, features};
        pro.pages.push_back("Settings");
        pro.features.push_back("Audit log");
        t[{a, "MVP"}] = std::move(mvp);
        t[{a, "Pro"}] = std::move(pro);
    };
    put("blog", false, true, {"Home", "Post", "Editor"}, {"Markdown posts", "Tags"});
    put("guestbook", true, true, {"Home", "Sign"}, {"Entries", "Moderation"});
    put("chat", true, true, {"Rooms", "Room"}, {"Messages", "Presence"});
    put("notes", false, false, {"List", "Note"}, {"Notes", "Search"});
    put("dashboard", false, true, {"Overview", "Reports"}, {"Charts", "Filters"});
    put("store", true, true, {"Catalog", "Product", "Cart"}, {"Products", "Checkout"});
    put("gallery", false, true, {"Grid", "Photo"}, {"Albums", "Uploads"});
    return t;
}

std::vector<DeclaredStratum> CurationConfig::declared_strata() const {
    std::vector<DeclaredStratum> out;
    out.reserve(archetypes.size() * complexities.size() * locales.size());
    for (const auto& a : archetypes) {
        for (const auto& c : complexities) {
            for (const auto& l : locales) {
                DeclaredStratum ds;
                ds.key = StratumKey{a, c, l};
                ds.count = quota;
                ds.platform = platform;
                out.push_back(std::move(ds));
            }
        }
    }
    return out;
}

const ArchetypeKit* CurationConfig::kit_for(const std::string& archetype, const std::string& complexity) const {
    auto it = kits.find({archetype, complexity});
    if (it == kits.end()) return nullptr;
    return &it->second;
}

// --------------------
// json readers
// --------------------

static void cfg_fail(const std::string& key, const char* want) {
    throw GoldenException(ErrorCode::InvalidConfig, "config key '" + key + "' must be " + want);
}

static void read_double(const json& o, const char* key, double& dst, const std::string& path) {
    if (!o.contains(key)) return;
    const auto& v = o[key];
    if (!v.is_number()) cfg_fail(path + key, "a number");
    dst = v.get<double>();
}

template <class T>
static void read_int(const json& o, const char* key, T& dst, const std::string& path) {
    if (!o.contains(key)) return;
    const auto& v = o[key];
    if (!v.is_number_integer()) cfg_fail(path + key, "an integer");
    dst = v.get<T>();
}

static void read_str(const json& o, const char* key, std::string& dst, const std::string& path) {
    if (!o.contains(key)) return;
    const auto& v = o[key];
    if (!v.is_string()) cfg_fail(path + key, "a string");
    dst = v.get<std::string>();
}

static void read_str_list(const json& o, const char* key, std::vector<std::string>& dst, const std::string& path) {
    if (!o.contains(key)) return;
    const auto& v = o[key];
    if (!v.is_array()) cfg_fail(path + key, "an array of strings");
    std::vector<std::string> out;
    for (const auto& e : v) {
        if (!e.is_string()) cfg_fail(path + key, "an array of strings");
        out.push_back(e.get<std::string>());
    }
    dst = std::move(out);
}

static const json* section(const json& root, const char* key) {
    if (!root.contains(key)) return nullptr;
    const auto& v = root[key];
    if (!v.is_object()) cfg_fail(key, "an object");
    return &v;
}

static KitTable read_kits(const json& kits) {
    KitTable t;
    for (auto ai = kits.begin(); ai != kits.end(); ++ai) {
        if (!ai.value().is_object()) cfg_fail("kits." + ai.key(), "an object");
        for (auto ci = ai.value().begin(); ci != ai.value().end(); ++ci) {
            const std::string path = "kits." + ai.key() + "." + ci.key() + ".";
            const json& k = ci.value();
            if (!k.is_object()) cfg_fail(path, "an object");
            if (!k.contains("server") || !k["server"].is_boolean()) cfg_fail(path + "server", "a boolean");

            ArchetypeKit kit;
            kit.server = k["server"].get<bool>();
            read_str_list(k, "pages", kit.pages, path);
            read_str_list(k, "features", kit.features, path);
            t[{ai.key(), ci.key()}] = std::move(kit);
        }
    }
    return t;
}

CurationConfig load_config_json(const std::filesystem::path& p) {
    const json root = read_json_file(p);
    if (!root.is_object()) throw GoldenException(ErrorCode::InvalidConfig, "config root must be an object: " + p.string());

    CurationConfig cfg;

    if (const json* d = section(root, "dedup")) {
        read_double(*d, "threshold", cfg.dedup_threshold, "dedup.");
        read_int(*d, "num_perm", cfg.num_perm, "dedup.");
        read_int(*d, "seed", cfg.seed, "dedup.");
        read_int(*d, "max_threads", cfg.max_threads, "dedup.");
    }
    if (const json* t = section(root, "top_up")) {
        read_int(*t, "quota", cfg.quota, "top_up.");
        read_int(*t, "max_attempts", cfg.max_attempts, "top_up.");
        read_int(*t, "oversub_factor", cfg.oversub_factor, "top_up.");
        read_str(*t, "synthesizer_cmd", cfg.synthesizer_cmd, "top_up.");
    }
    if (const json* d = section(root, "diversity")) {
        read_int(*d, "max_swaps", cfg.max_swaps, "diversity.");
        read_int(*d, "min_cluster_size", cfg.min_cluster_size, "diversity.");
        read_double(*d, "max_gini", cfg.max_gini, "diversity.");
        read_double(*d, "shannon_threshold", cfg.shannon_threshold, "diversity.");
    }
    if (const json* s = section(root, "split")) {
        read_int(*s, "train", cfg.train_cap, "split.");
        read_int(*s, "val", cfg.val_cap, "split.");
        read_int(*s, "test", cfg.test_cap, "split.");
    }
    if (const json* s = section(root, "strata")) {
        read_str_list(*s, "archetypes", cfg.archetypes, "strata.");
        read_str_list(*s, "complexities", cfg.complexities, "strata.");
        read_str_list(*s, "locales", cfg.locales, "strata.");
        read_int(*s, "count", cfg.quota, "strata.");
        read_str(*s, "platform", cfg.platform, "strata.");
    }
    if (const json* k = section(root, "kits")) {
        cfg.kits = read_kits(*k);
    }

    validate_config(cfg);
    return cfg;
}

void apply_env_overrides(CurationConfig& cfg) {
    const int64_t th = env_int("GOLDEN_THREADS", 0);
    if (th > 0) cfg.max_threads = (unsigned)th;

    const int64_t seed = env_int("GOLDEN_SEED", -1);
    if (seed >= 0) cfg.seed = (uint64_t)seed;

    if (const char* s = std::getenv("GOLDEN_DEDUP_THRESHOLD")) {
        char* end = nullptr;
        const double v = std::strtod(s, &end);
        if (end != s && *end == '\0' && v > 0.0 && v <= 1.0) cfg.dedup_threshold = v;
        else std::cerr << "[golden] ignoring GOLDEN_DEDUP_THRESHOLD=" << s << "\n";
    }
}

void validate_config(const CurationConfig& cfg) {
    auto bad = [](const std::string& m) { throw GoldenException(ErrorCode::InvalidConfig, m); };

    if (!(cfg.dedup_threshold > 0.0 && cfg.dedup_threshold <= 1.0)) bad("dedup.threshold must be in (0, 1]");
    if (cfg.num_perm <= 0) bad("dedup.num_perm must be > 0");
    if (cfg.max_threads == 0) bad("dedup.max_threads must be > 0");
    if (cfg.quota <= 0) bad("quota must be > 0");
    if (cfg.max_attempts < 0) bad("top_up.max_attempts must be >= 0");
    if (cfg.oversub_factor <= 0) bad("top_up.oversub_factor must be > 0");
    if (cfg.max_swaps < 0) bad("diversity.max_swaps must be >= 0");
    if (cfg.train_cap < 0 || cfg.val_cap < 0 || cfg.test_cap < 0) bad("split caps must be >= 0");
    if (cfg.archetypes.empty() || cfg.complexities.empty() || cfg.locales.empty()) bad("strata must not be empty");

    for (const auto& a : cfg.archetypes) {
        for (const auto& c : cfg.complexities) {
            if (!cfg.kit_for(a, c)) bad("kits: missing entry for " + a + "/" + c);
        }
    }
}

} // namespace golden
