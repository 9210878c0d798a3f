// Golden/cpp/common/text_common.cpp
#include "text_common.h"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace {

static inline void append_utf8(uint32_t cp, std::string& out) {
    if (cp <= 0x7F) {
        out.push_back((char)cp);
    } else if (cp <= 0x7FF) {
        out.push_back((char)(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back((char)(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        out.push_back((char)(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
}

static inline bool is_word_ascii(unsigned char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

static inline bool is_hspace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

struct NamedEntity {
    const char* name;
    uint32_t cp;
};

static const NamedEntity kEntities[] = {
    {"amp", '&'},  {"lt", '<'},     {"gt", '>'},     {"quot", '"'},
    {"apos", '\''}, {"nbsp", 0x00A0}, {"copy", 0x00A9}, {"reg", 0x00AE},
    {"mdash", 0x2014}, {"ndash", 0x2013}, {"hellip", 0x2026},
};

// "&...;" at s[i]; returns consumed bytes or 0
static size_t decode_entity(std::string_view s, size_t i, std::string& out) {
    const size_t semi = s.find(';', i + 1);
    if (semi == std::string_view::npos || semi - i > 12) return 0;
    std::string_view body = s.substr(i + 1, semi - i - 1);
    if (body.empty()) return 0;

    if (body[0] == '#') {
        uint32_t cp = 0;
        bool hex = body.size() > 1 && (body[1] == 'x' || body[1] == 'X');
        std::string_view digits = body.substr(hex ? 2 : 1);
        if (digits.empty()) return 0;
        for (char c : digits) {
            const unsigned char u = (unsigned char)c;
            uint32_t d = 0;
            if (u >= '0' && u <= '9') d = u - '0';
            else if (hex && u >= 'a' && u <= 'f') d = u - 'a' + 10;
            else if (hex && u >= 'A' && u <= 'F') d = u - 'A' + 10;
            else return 0;
            cp = cp * (hex ? 16u : 10u) + d;
            if (cp > 0x10FFFF) return 0;
        }
        append_utf8(cp, out);
        return semi - i + 1;
    }

    for (const auto& e : kEntities) {
        if (body == e.name) {
            append_utf8(e.cp, out);
            return semi - i + 1;
        }
    }
    return 0;
}

} // namespace

std::string html_unescape(std::string_view s) {
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        const char c = s[i];
        if (c == '&') {
            const size_t used = decode_entity(s, i, out);
            if (used > 0) { i += used; continue; }
        } else if (c == '<' && i + 1 < s.size()) {
            // тег: <a ...>, </a>, <!-- -->, <?x ?>
            const unsigned char n = (unsigned char)s[i + 1];
            if (std::isalpha(n) || n == '/' || n == '!' || n == '?') {
                const size_t close = s.find('>', i + 1);
                if (close != std::string_view::npos) { i = close + 1; continue; }
            }
        }
        out.push_back(c);
        ++i;
    }
    return out;
}

std::string strip_yaml_frontmatter(std::string_view s) {
    if (s.compare(0, 3, "---") != 0) return std::string(s);

    size_t i = 3;
    while (i < s.size() && is_hspace(s[i])) ++i;
    if (i >= s.size() || s[i] != '\n') return std::string(s);
    const size_t body = i + 1;

    size_t from = body;
    while (true) {
        const size_t close = s.find("\n---", from);
        if (close == std::string_view::npos) return std::string(s);
        size_t j = close + 4;
        while (j < s.size() && is_hspace(s[j])) ++j;
        if (j < s.size() && s[j] == '\n') return std::string(s.substr(j + 1));
        from = close + 1;
    }
}

std::string strip_h2_headers(std::string_view s) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        size_t eol = s.find('\n', i);
        const size_t end = (eol == std::string_view::npos) ? s.size() : eol;
        std::string_view line = s.substr(i, end - i);

        const bool h2 = line.size() >= 3 && line[0] == '#' && line[1] == '#' && is_hspace(line[2]);
        if (!h2) out.append(line.data(), line.size());
        if (eol != std::string_view::npos) out.push_back('\n');
        i = (eol == std::string_view::npos) ? s.size() : eol + 1;
    }
    return out;
}

std::string strip_literals(std::string_view s, const std::vector<std::string>& literals) {
    std::string cur(s);
    for (const auto& lit : literals) {
        if (lit.empty()) continue;
        std::string next;
        next.reserve(cur.size());
        size_t pos = 0;
        while (true) {
            const size_t hit = cur.find(lit, pos);
            if (hit == std::string::npos) break;
            next.append(cur, pos, hit - pos);
            pos = hit + lit.size();
        }
        next.append(cur, pos, std::string::npos);
        cur.swap(next);
    }
    return cur;
}

std::string strip_fenced_code(std::string_view s) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s.compare(i, 3, "```") == 0) {
            // ```[^`]*``` : блок кончается на первом же backtick, если там ```
            const size_t tick = s.find('`', i + 3);
            if (tick != std::string_view::npos && s.compare(tick, 3, "```") == 0) {
                i = tick + 3;
                continue;
            }
        }
        out.push_back(s[i]);
        ++i;
    }
    return out;
}

const std::vector<std::string>& boilerplate_literals() {
    static const std::vector<std::string> lits = {"replit.toml", "replit.nix", "0.0.0.0"};
    return lits;
}

std::string normalize_spec_text(std::string_view s) {
    std::string t = html_unescape(s);
    t = strip_yaml_frontmatter(t);
    t = strip_h2_headers(t);
    t = strip_literals(t, boilerplate_literals());
    t = strip_fenced_code(t);
    return t;
}

void tokenize_words_to(std::string_view s, std::vector<std::string>& out) {
    out.clear();
    const size_t n = s.size();
    size_t i = 0;

    while (i < n) {
        while (i < n && !is_word_ascii((unsigned char)s[i])) ++i;
        if (i >= n) break;

        std::string tok;
        while (i < n && is_word_ascii((unsigned char)s[i])) {
            tok.push_back((char)std::tolower((unsigned char)s[i]));
            ++i;
        }
        out.push_back(std::move(tok));
    }
}

std::vector<std::string> tokenize_words(std::string_view s) {
    std::vector<std::string> out;
    tokenize_words_to(s, out);
    return out;
}

std::vector<std::string> word_shingles(const std::vector<std::string>& tokens, int n) {
    std::vector<std::string> out;
    if (n <= 0 || tokens.size() < (size_t)n) return out;

    const size_t cnt = tokens.size() - (size_t)n + 1;
    out.reserve(cnt);
    for (size_t pos = 0; pos < cnt; ++pos) {
        std::string sh = tokens[pos];
        for (int k = 1; k < n; ++k) {
            sh.push_back(' ');
            sh += tokens[pos + (size_t)k];
        }
        out.push_back(std::move(sh));
    }
    return out;
}

// FNV-1a 64-bit
uint64_t fnv1a64(std::string_view s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= (uint64_t)c;
        h *= 1099511628211ULL;
    }
    return h;
}
