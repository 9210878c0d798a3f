// Golden/cpp/include/golden/collaborators.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "golden/item.h"

namespace golden {

struct ValidationOutcome {
    bool accepted{false};
    Item corrected;                    // item with band correction applied
    std::vector<std::string> diagnostics;
};

class Validator {
public:
    virtual ~Validator() = default;
    virtual ValidationOutcome validate(const Item& item) const = 0;
};

// A logical request for fresh candidates.
struct Slot {
    std::string slot_id;
    std::string archetype;
    std::string complexity;
    std::string locale;
    int rep{0};
    int seq{0};
    Band target_band{Band::Standard};
    Platform platform;
    std::vector<std::string> pages;     // from the archetype kit
    std::vector<std::string> features;
};

nlohmann::json slot_to_json(const Slot& s);

class Synthesizer {
public:
    virtual ~Synthesizer() = default;
    virtual std::vector<Item> synthesize(const Slot& slot, int variant_count, uint64_t seed) = 0;
};

// Runs an external generator through bash. Placeholders in the command:
//   {slot_json}  path of a file holding the slot object
//   {out_jsonl}  path the generator must write candidates to
//   {variants}   variant count
//   {seed}       decimal seed
// Nonzero exit or unreadable output => GoldenException(SynthesisFailed).
class CommandSynthesizer : public Synthesizer {
public:
    explicit CommandSynthesizer(std::string command_template,
                                std::filesystem::path work_dir = std::filesystem::temp_directory_path());

    std::vector<Item> synthesize(const Slot& slot, int variant_count, uint64_t seed) override;

    const std::string& command_template() const { return cmd_; }

private:
    std::string cmd_;
    std::filesystem::path work_dir_;
    int calls_{0};
};

std::string shell_quote(const std::string& s);

} // namespace golden
