// Golden/cpp/src/io.cpp
#include "golden/io.h"
#include "golden/errors.h"
#include "golden/format.h"

#include <fstream>
#include <sstream>

#include <simdjson.h>

using json = nlohmann::json;

namespace golden {

namespace fs = std::filesystem;

static std::string parse_err(size_t line_no, const std::string& what) {
    return "line " + std::to_string(line_no) + ": " + what;
}

static std::string req_string(const simdjson::dom::element& doc, const char* key, size_t line_no) {
    std::string_view sv;
    if (doc[key].get(sv)) throw GoldenException(ErrorCode::ParseError, parse_err(line_no, std::string("missing string field '") + key + "'"));
    return std::string(sv);
}

static std::string opt_string(const simdjson::dom::element& doc, const char* key) {
    std::string_view sv;
    if (doc[key].get(sv)) return std::string();
    return std::string(sv);
}

static int opt_int(const simdjson::dom::element& doc, const char* key, int defv) {
    int64_t v = 0;
    if (doc[key].get(v)) return defv;
    return (int)v;
}

static Item item_from_dom(const simdjson::dom::element& doc, size_t line_no) {
    Item it;
    it.candidate_id = opt_string(doc, "candidate_id");
    it.slot_id = opt_string(doc, "slot_id");
    // packaged items carry only "id"
    if (it.slot_id.empty()) it.slot_id = opt_string(doc, "id");
    if (it.candidate_id.empty()) it.candidate_id = it.slot_id;
    if (it.candidate_id.empty()) throw GoldenException(ErrorCode::ParseError, parse_err(line_no, "missing candidate_id"));

    it.archetype = req_string(doc, "archetype", line_no);
    it.complexity = req_string(doc, "complexity", line_no);
    it.locale = req_string(doc, "locale", line_no);
    it.rep = opt_int(doc, "rep", 0);
    it.seq = opt_int(doc, "seq", 0);
    it.spec = req_string(doc, "spec", line_no);
    it.source_candidate_id = opt_string(doc, "source_candidate_id");

    const std::string band = req_string(doc, "length_band", line_no);
    auto b = parse_band(band);
    if (!b) throw GoldenException(ErrorCode::ParseError, parse_err(line_no, "bad length_band: " + band));
    it.length_band = *b;

    simdjson::dom::element pl;
    if (!doc["platform"].get(pl)) {
        std::string_view name;
        if (!pl["name"].get(name)) it.platform.name = std::string(name);
        bool server = false;
        if (!pl["server"].get(server)) it.platform.server = server;
        std::string_view bind;
        if (!pl["bind"].get(bind)) it.platform.bind = std::string(bind);
    }
    return it;
}

std::vector<Item> read_items_jsonl(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw GoldenException(ErrorCode::IoError, "cannot open: " + p.string());

    simdjson::dom::parser parser;
    std::vector<Item> out;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        simdjson::dom::element doc;
        auto err = parser.parse(line).get(doc);
        if (err) {
            throw GoldenException(ErrorCode::ParseError,
                                  p.string() + ": " + parse_err(line_no, simdjson::error_message(err)));
        }
        if (!doc.is_object()) throw GoldenException(ErrorCode::ParseError, p.string() + ": " + parse_err(line_no, "not an object"));
        out.push_back(item_from_dom(doc, line_no));
    }
    return out;
}

json item_to_json(const Item& it) {
    json j;
    j["candidate_id"] = it.candidate_id;
    j["slot_id"] = it.slot_id;
    j["archetype"] = it.archetype;
    j["complexity"] = it.complexity;
    j["locale"] = it.locale;
    j["rep"] = it.rep;
    j["seq"] = it.seq;
    j["length_band"] = band_name(it.length_band);

    json pl;
    pl["name"] = it.platform.name;
    pl["server"] = it.platform.server;
    if (it.platform.bind) pl["bind"] = *it.platform.bind;
    else pl["bind"] = nullptr;
    j["platform"] = pl;

    j["spec"] = it.spec;
    if (!it.source_candidate_id.empty()) j["source_candidate_id"] = it.source_candidate_id;
    return j;
}

static void write_text_atomic(const fs::path& p, const std::string& content) {
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    const fs::path tmp = p.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw GoldenException(ErrorCode::IoError, "cannot open for write: " + tmp.string());
        out.write(content.data(), (std::streamsize)content.size());
        out.flush();
        if (!out) throw GoldenException(ErrorCode::IoError, "write failed: " + tmp.string());
    }
    if (!atomic_replace_file_best_effort(tmp, p)) {
        throw GoldenException(ErrorCode::IoError, "cannot replace: " + p.string());
    }
}

void write_json_lines(const fs::path& p, const std::vector<json>& rows) {
    std::string buf;
    for (const auto& r : rows) {
        buf += r.dump();
        buf.push_back('\n');
    }
    write_text_atomic(p, buf);
}

void write_items_jsonl(const fs::path& p, const std::vector<Item>& items) {
    std::vector<json> rows;
    rows.reserve(items.size());
    for (const auto& it : items) rows.push_back(item_to_json(it));
    write_json_lines(p, rows);
}

std::string canonical_json(const json& j) {
    std::string s = j.dump(2);
    if (s.empty() || s.back() != '\n') s.push_back('\n');
    return s;
}

void write_json_canonical(const fs::path& p, const json& j) {
    write_text_atomic(p, canonical_json(j));
}

json read_json_file(const fs::path& p) {
    std::ifstream in(p);
    if (!in) throw GoldenException(ErrorCode::IoError, "cannot open: " + p.string());
    try {
        json j;
        in >> j;
        return j;
    } catch (const json::parse_error& e) {
        throw GoldenException(ErrorCode::ParseError, p.string() + ": " + e.what());
    }
}

bool file_sha256(const fs::path& p, std::string& out_hex, std::string* err) {
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        if (err) *err = "cannot open: " + p.string();
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        if (err) *err = "read failed: " + p.string();
        return false;
    }
    out_hex = sha256_hex(ss.str());
    return true;
}

} // namespace golden
