// Golden/cpp/tools/golden_dedup_main.cpp
#include <iostream>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>
#include "golden/config.h"
#include "golden/dedup.h"
#include "golden/io.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "Usage: golden_dedup <in.jsonl> <out.jsonl> <report.json> [--threshold X] [--seed N] [--threads N]\n";
        return 1;
    }

    std::filesystem::path in = argv[1];
    std::filesystem::path out = argv[2];
    std::filesystem::path report = argv[3];

    golden::CurationConfig cfg;
    golden::apply_env_overrides(cfg);

    try {
        for (int i = 4; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--threshold") cfg.dedup_threshold = std::stod(arg_value(i, argc, argv));
            else if (a == "--seed") cfg.seed = std::stoull(arg_value(i, argc, argv));
            else if (a == "--threads") cfg.max_threads = (unsigned)std::stoul(arg_value(i, argc, argv));
        }
    } catch (const std::exception& e) {
        std::cerr << "bad argument: " << e.what() << "\n";
        return 1;
    }

    try {
        golden::validate_config(cfg);
        const auto items = golden::read_items_jsonl(in);

        golden::FingerprintCache cache(cfg.num_perm, cfg.seed);
        golden::DedupOptions opt;
        opt.threshold = cfg.dedup_threshold;
        opt.max_threads = cfg.max_threads;
        const auto res = golden::resolve_duplicates(items, cache, opt);

        golden::write_items_jsonl(out, res.kept);
        golden::write_json_canonical(report, golden::to_json(res.report));

        nlohmann::json j;
        j["ok"] = true;
        j["in"] = items.size();
        j["kept"] = res.kept.size();
        j["dropped"] = res.dropped.size();
        j["edges"] = res.report.edges.size();
        std::cout << j.dump() << "\n";
        return 0;
    } catch (const std::exception& e) {
        nlohmann::json j;
        j["ok"] = false;
        j["message"] = e.what();
        std::cout << j.dump() << "\n";
        return 2;
    }
}
