// Golden/cpp/tools/golden_split_main.cpp
#include <iostream>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include "golden/io.h"
#include "golden/splitter.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: golden_split <in.jsonl> <splits.json> [--train N] [--val N] [--test N] [--seed N]\n";
        return 1;
    }

    std::filesystem::path in = argv[1];
    std::filesystem::path out = argv[2];
    golden::SplitCaps caps;
    std::optional<uint64_t> seed;

    try {
        for (int i = 3; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--train") caps.train = std::stoi(arg_value(i, argc, argv));
            else if (a == "--val") caps.val = std::stoi(arg_value(i, argc, argv));
            else if (a == "--test") caps.test = std::stoi(arg_value(i, argc, argv));
            else if (a == "--seed") seed = std::stoull(arg_value(i, argc, argv));
        }
    } catch (const std::exception& e) {
        std::cerr << "bad argument: " << e.what() << "\n";
        return 1;
    }

    try {
        const auto items = golden::read_items_jsonl(in);
        const auto a = golden::split_stratified(items, caps, seed);
        const nlohmann::json j = golden::to_json(a);
        golden::write_json_canonical(out, j);

        nlohmann::json r;
        r["ok"] = true;
        r["counts"] = j["counts"];
        r["digest"] = a.digest;
        std::cout << r.dump() << "\n";
        return 0;
    } catch (const std::exception& e) {
        nlohmann::json r;
        r["ok"] = false;
        r["message"] = e.what();
        std::cout << r.dump() << "\n";
        return 2;
    }
}
