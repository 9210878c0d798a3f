// Golden/cpp/tools/golden_curate_main.cpp
#include <iostream>
#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include "golden/config.h"
#include "golden/errors.h"
#include "golden/pipeline.h"
#include "golden/top_up.h"
#include "golden/validator.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: golden_curate <candidates.jsonl> <out_dir> [--config FILE] [--synth-cmd CMD] "
                     "[--validator spec|band] [--threads N]\n";
        return 1;
    }

    std::filesystem::path input = argv[1];
    std::filesystem::path out_dir = argv[2];
    std::string config_path;
    std::string synth_cmd;
    std::string validator_kind = "spec";
    int threads = 0;

    try {
        for (int i = 3; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--config") config_path = arg_value(i, argc, argv);
            else if (a == "--synth-cmd") synth_cmd = arg_value(i, argc, argv);
            else if (a == "--validator") validator_kind = arg_value(i, argc, argv);
            else if (a == "--threads") threads = std::stoi(arg_value(i, argc, argv));
            else {
                std::cerr << "unknown argument: " << a << "\n";
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "bad argument: " << e.what() << "\n";
        return 1;
    }
    if (validator_kind != "spec" && validator_kind != "band") {
        std::cerr << "--validator must be spec or band\n";
        return 1;
    }

    try {
        golden::CurationConfig cfg;
        if (!config_path.empty()) cfg = golden::load_config_json(config_path);
        golden::apply_env_overrides(cfg);
        if (threads > 0) cfg.max_threads = (unsigned)threads;
        if (!synth_cmd.empty()) cfg.synthesizer_cmd = synth_cmd;
        golden::validate_config(cfg);

        std::unique_ptr<golden::Synthesizer> synth;
        if (!cfg.synthesizer_cmd.empty()) synth = std::make_unique<golden::CommandSynthesizer>(cfg.synthesizer_cmd);

        std::unique_ptr<golden::Validator> validator;
        if (validator_kind == "band") validator = std::make_unique<golden::BandValidator>();
        else validator = std::make_unique<golden::SpecValidator>(&cfg.kits, cfg.platform);

        const golden::PipelineSummary s = golden::run_pipeline(cfg, input, out_dir, synth.get(), *validator);

        nlohmann::json j = golden::to_json(s);
        j["ok"] = true;
        j["out_dir"] = out_dir.string();
        std::cout << j.dump() << "\n";
        return 0;
    } catch (const golden::QuotaUnmetError& e) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = golden::error_code_name(e.code());
        j["stratum"] = e.stratum().str();
        j["have"] = e.have();
        j["need"] = e.need();
        j["message"] = e.what();
        std::cout << j.dump() << "\n";
        return 3;
    } catch (const golden::GoldenException& e) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = golden::error_code_name(e.code());
        j["message"] = e.what();
        std::cout << j.dump() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[golden] fatal: " << e.what() << "\n";
        return 2;
    }
}
