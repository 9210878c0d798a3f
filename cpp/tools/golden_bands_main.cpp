// Golden/cpp/tools/golden_bands_main.cpp
#include <iostream>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>
#include "golden/bands.h"
#include "golden/io.h"

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: golden_bands <in.jsonl> <band_report.json> [--enforce]\n";
        return 1;
    }

    std::filesystem::path in = argv[1];
    std::filesystem::path report = argv[2];
    bool enforce = false;
    for (int i = 3; i < argc; ++i) {
        if (std::string(argv[i]) == "--enforce") enforce = true;
    }

    try {
        const auto items = golden::read_items_jsonl(in);

        size_t mismatched = 0;
        for (const auto& it : items) {
            const auto bc = golden::validate_band(it);
            if (!bc.ok) {
                ++mismatched;
                std::cerr << "[golden.bands] " << it.candidate_id << ": " << bc.error << "\n";
            }
        }

        const nlohmann::json br = golden::band_report(items);
        golden::write_json_canonical(report, br);

        nlohmann::json j;
        j["ok"] = br["is_valid"].get<bool>() && mismatched == 0;
        j["distribution"] = br["distribution"];
        j["mismatched"] = mismatched;
        j["suggestions"] = br["suggestions"].size();
        std::cout << j.dump() << "\n";
        return (enforce && !j["ok"].get<bool>()) ? 2 : 0;
    } catch (const std::exception& e) {
        nlohmann::json j;
        j["ok"] = false;
        j["message"] = e.what();
        std::cout << j.dump() << "\n";
        return 2;
    }
}
