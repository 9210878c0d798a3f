// Golden/cpp/src/validator.cpp
#include "golden/validator.h"
#include "golden/bands.h"

#include <cctype>
#include <regex>
#include <set>

namespace golden {

static std::string trim(const std::string& s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    const size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static bool is_h2_line(const std::string& line) {
    return line.size() >= 3 && line[0] == '#' && line[1] == '#' && line[2] != '#' &&
           (line[2] == ' ' || line[2] == '\t');
}

ValidationOutcome BandValidator::validate(const Item& item) const {
    ValidationOutcome out;
    out.corrected = item;
    const BandCheck bc = validate_band(item);
    if (!bc.ok) {
        out.diagnostics.push_back("BAND_ERR: " + bc.error);
        if (bc.actual) out.corrected.length_band = *bc.actual;
        return out;
    }
    out.accepted = true;
    return out;
}

const std::vector<std::string>& required_sections() {
    static const std::vector<std::string> s = {
        "Vision", "Tech Stack", "Data Models", "Pages & Routes", "Feature Plan", "NFR & SLOs",
    };
    return s;
}

std::map<std::string, std::string> extract_sections(const std::string& spec) {
    std::map<std::string, std::string> out;
    std::string title;
    std::string body;
    bool open = false;

    auto flush = [&]() {
        if (open) out[title] = trim(body);
        body.clear();
    };

    size_t i = 0;
    while (i <= spec.size()) {
        size_t eol = spec.find('\n', i);
        if (eol == std::string::npos) eol = spec.size();
        const std::string line = spec.substr(i, eol - i);

        if (is_h2_line(line)) {
            flush();
            title = trim(line.substr(3));
            open = true;
        } else if (open) {
            body += line;
            body.push_back('\n');
        }
        if (eol == spec.size()) break;
        i = eol + 1;
    }
    flush();
    return out;
}

std::string check_h2_sections(const std::string& spec) {
    const auto sections = extract_sections(spec);
    const auto& req = required_sections();
    const std::set<std::string> want(req.begin(), req.end());

    std::string missing, extra;
    for (const auto& r : req) {
        if (!sections.count(r)) missing += (missing.empty() ? "" : ", ") + r;
    }
    for (const auto& kv : sections) {
        if (!want.count(kv.first)) extra += (extra.empty() ? "" : ", ") + kv.first;
    }
    if (!missing.empty() || !extra.empty()) {
        std::string m = "section validation failed:";
        if (!missing.empty()) m += " missing sections: " + missing + ".";
        if (!extra.empty()) m += " extra sections: " + extra + ".";
        return m;
    }

    std::string empty;
    for (const auto& r : req) {
        if (sections.at(r).empty()) empty += (empty.empty() ? "" : ", ") + r;
    }
    if (!empty.empty()) return "section validation failed: empty sections: " + empty + ".";
    return std::string();
}

// `a` ... `b` ... in order after `from`
static bool ordered_after(const std::string& s, size_t from, const std::vector<std::string>& needles) {
    size_t pos = from;
    for (const auto& n : needles) {
        pos = s.find(n, pos);
        if (pos == std::string::npos) return false;
        pos += n.size();
    }
    return true;
}

std::string check_acl_block(const std::string& spec) {
    if (spec.find("### Access Control") == std::string::npos) return "missing Access Control section";

    const size_t member = spec.find("**Member**:");
    const size_t admin = spec.find("**Admin**:");
    if (member == std::string::npos || admin == std::string::npos) return "missing required roles (Member and Admin)";

    if (!ordered_after(spec, member, {"`read:self`", "`write:self`"})) {
        return "missing required Member permissions (read:self, write:self)";
    }
    if (!ordered_after(spec, admin, {"`read:any`", "`write:any`", "`manage`"})) {
        return "missing required Admin permissions (read:any, write:any, manage)";
    }
    return std::string();
}

bool has_banned_network_terms(const std::string& text) {
    static const std::regex hosting(R"(\bhosting\b)", std::regex::icase);
    static const std::vector<std::regex> banned = {
        std::regex(R"(\bserver(?!less)\b)", std::regex::icase),
        std::regex(R"(\bsockets?\b)", std::regex::icase),
        std::regex(R"(\bbind(?:ing)?\s+0\.0\.0\.0\b)", std::regex::icase),
        std::regex(R"(\b(?:listen|socket|port)\b)", std::regex::icase),
        std::regex(R"(\bhost\b)", std::regex::icase),
    };
    const std::string t = std::regex_replace(text, hosting, "");
    for (const auto& re : banned) {
        if (std::regex_search(t, re)) return true;
    }
    return false;
}

std::string check_platform_rules(const Item& item, const std::string& platform_name) {
    const Platform& p = item.platform;
    if (p.name != platform_name) return "platform name must be '" + platform_name + "'";
    if (p.server && (!p.bind || *p.bind != "0.0.0.0")) return "if server is true, bind must be '0.0.0.0'";
    if (!p.server && p.bind) return "if server is false, bind must be null";
    if (!p.server && has_banned_network_terms(item.spec)) return "non-server spec contains banned network binding terms";
    return std::string();
}

std::vector<std::pair<std::string, std::string>> find_pii(const std::string& text) {
    static const std::regex email(R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)");
    static const std::regex phone(R"(\b(?:\+\d{1,3}[- ]?)?\(?\d{3}\)?[- ]?\d{3}[- ]?\d{4}\b)");

    std::vector<std::pair<std::string, std::string>> out;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), email); it != std::sregex_iterator(); ++it) {
        out.emplace_back("email", it->str());
    }
    for (auto it = std::sregex_iterator(text.begin(), text.end(), phone); it != std::sregex_iterator(); ++it) {
        out.emplace_back("phone", it->str());
    }
    return out;
}

CodeStyle check_code_style(const std::string& text, int max_blocks, int max_lines) {
    CodeStyle cs;
    size_t pos = 0;
    while (true) {
        const size_t open = text.find("```", pos);
        if (open == std::string::npos) break;
        const size_t close = text.find("```", open + 3);
        if (close == std::string::npos) break;

        size_t body = open + 3;
        // optional language tag line
        size_t k = body;
        while (k < close && std::isalpha((unsigned char)text[k])) ++k;
        if (k < close && text[k] == '\n') body = k + 1;

        const std::string block = text.substr(body, close - body);
        size_t i = 0;
        while (i <= block.size()) {
            size_t eol = block.find('\n', i);
            if (eol == std::string::npos) eol = block.size();
            if (!trim(block.substr(i, eol - i)).empty()) ++cs.lines;
            if (eol == block.size()) break;
            i = eol + 1;
        }
        ++cs.blocks;
        pos = close + 3;
    }
    cs.ok = cs.blocks <= max_blocks && cs.lines <= max_lines;
    return cs;
}

ValidationOutcome SpecValidator::validate(const Item& item) const {
    ValidationOutcome out;
    out.corrected = item;
    auto& diag = out.diagnostics;

    std::string e = check_h2_sections(item.spec);
    if (!e.empty()) diag.push_back(e);

    e = check_acl_block(item.spec);
    if (!e.empty()) diag.push_back(e);

    e = check_platform_rules(item, platform_);
    if (!e.empty()) diag.push_back("PLATFORM_ERR: " + e);

    if (kits_) {
        auto it = kits_->find({item.archetype, item.complexity});
        if (it == kits_->end()) {
            diag.push_back("KIT_ERR: no kit for " + item.archetype + "/" + item.complexity);
        } else if (it->second.server != item.platform.server) {
            diag.push_back("KIT_ERR: platform.server disagrees with kit for " + item.archetype + "/" + item.complexity);
        }
    }

    const BandCheck bc = validate_band(item);
    if (!bc.ok) {
        diag.push_back("BAND_ERR: " + bc.error);
        if (bc.actual) out.corrected.length_band = *bc.actual;
    }

    const auto pii = find_pii(item.spec);
    if (!pii.empty()) {
        std::set<std::string> kinds;
        for (const auto& p : pii) kinds.insert(p.first);
        std::string k;
        for (const auto& s : kinds) k += (k.empty() ? "" : ", ") + s;
        diag.push_back("PII_ERR: found potential PII: " + k);
    }

    const CodeStyle cs = check_code_style(item.spec);
    if (!cs.ok) {
        diag.push_back("STYLE_ERR: code blocks (" + std::to_string(cs.blocks) + ") or lines (" +
                       std::to_string(cs.lines) + ") exceed limits (max 3 blocks, 40 lines)");
    }

    out.accepted = diag.empty();
    return out;
}

} // namespace golden
