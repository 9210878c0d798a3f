// Golden/cpp/src/collaborators.cpp
#include "golden/collaborators.h"
#include "golden/errors.h"
#include "golden/io.h"

#include <cstdlib>
#include <ctime>
#include <iostream>

namespace golden {

namespace fs = std::filesystem;

nlohmann::json slot_to_json(const Slot& s) {
    nlohmann::json j;
    j["slot_id"] = s.slot_id;
    j["archetype"] = s.archetype;
    j["complexity"] = s.complexity;
    j["locale"] = s.locale;
    j["rep"] = s.rep;
    j["seq"] = s.seq;
    j["length_band"] = band_name(s.target_band);
    j["platform"] = nlohmann::json{{"name", s.platform.name},
                                   {"server", s.platform.server},
                                   {"bind", s.platform.bind ? nlohmann::json(*s.platform.bind) : nlohmann::json(nullptr)}};
    j["pages"] = s.pages;
    j["features"] = s.features;
    return j;
}

std::string shell_quote(const std::string& s) {
    // single-quote safe for bash: ' -> '\''
    std::string out;
    out.reserve(s.size() + 8);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

static void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

CommandSynthesizer::CommandSynthesizer(std::string command_template, fs::path work_dir)
    : cmd_(std::move(command_template)), work_dir_(std::move(work_dir)) {
    if (cmd_.empty()) throw GoldenException(ErrorCode::InvalidArgs, "synthesizer command is empty");
}

std::vector<Item> CommandSynthesizer::synthesize(const Slot& slot, int variant_count, uint64_t seed) {
    const std::string tag = "golden_synth_" + std::to_string((uint64_t)std::time(nullptr)) + "_" + std::to_string(calls_++);
    const fs::path slot_path = work_dir_ / (tag + "_slot.json");
    const fs::path out_path = work_dir_ / (tag + "_out.jsonl");

    write_json_canonical(slot_path, slot_to_json(slot));

    std::string cmd = cmd_;
    replace_all(cmd, "{slot_json}", shell_quote(slot_path.string()));
    replace_all(cmd, "{out_jsonl}", shell_quote(out_path.string()));
    replace_all(cmd, "{variants}", std::to_string(variant_count));
    replace_all(cmd, "{seed}", std::to_string(seed));

    const std::string full = "bash -lc " + shell_quote(cmd);
    const int rc = std::system(full.c_str());

    std::error_code ec;
    fs::remove(slot_path, ec);

    if (rc != 0) {
        fs::remove(out_path, ec);
        throw GoldenException(ErrorCode::SynthesisFailed,
                              "synthesizer exited with " + std::to_string(rc) + " for slot " + slot.slot_id);
    }

    std::vector<Item> items;
    try {
        items = read_items_jsonl(out_path);
    } catch (const GoldenException& e) {
        fs::remove(out_path, ec);
        throw GoldenException(ErrorCode::SynthesisFailed, std::string("synthesizer output unreadable: ") + e.what());
    }
    fs::remove(out_path, ec);

    std::cerr << "[golden.synth] slot=" << slot.slot_id << " seed=" << seed
              << " variants=" << variant_count << " got=" << items.size() << "\n";
    return items;
}

} // namespace golden
