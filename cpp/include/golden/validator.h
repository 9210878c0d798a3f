// Golden/cpp/include/golden/validator.h
#pragma once
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "golden/collaborators.h"
#include "golden/config.h"

namespace golden {

// Only the length-band check. Mismatch => rejected, corrected.length_band =
// actual band (when there is one).
class BandValidator : public Validator {
public:
    ValidationOutcome validate(const Item& item) const override;
};

// Structural and style checks of a generated spec.
class SpecValidator : public Validator {
public:
    explicit SpecValidator(const KitTable* kits = nullptr, std::string platform = "replit")
        : kits_(kits), platform_(std::move(platform)) {}

    ValidationOutcome validate(const Item& item) const override;

private:
    const KitTable* kits_;
    std::string platform_;
};

// H2 title -> trimmed body. H3 lines stay inside the enclosing section.
std::map<std::string, std::string> extract_sections(const std::string& spec);

const std::vector<std::string>& required_sections();

// "" on success, otherwise a diagnostic
std::string check_h2_sections(const std::string& spec);
std::string check_acl_block(const std::string& spec);
std::string check_platform_rules(const Item& item, const std::string& platform_name);

bool has_banned_network_terms(const std::string& text);

// (kind, match), kind is "email" or "phone"
std::vector<std::pair<std::string, std::string>> find_pii(const std::string& text);

struct CodeStyle {
    int blocks{0};
    int lines{0};   // non-empty lines across all fenced blocks
    bool ok{true};
};

CodeStyle check_code_style(const std::string& text, int max_blocks = 3, int max_lines = 40);

} // namespace golden
