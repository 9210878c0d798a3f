// Golden/cpp/include/golden/io.h
#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "golden/item.h"

namespace golden {

// JSONL -> items. Blank lines skipped. Malformed line or missing required
// field => GoldenException(ParseError) naming the 1-based line number.
std::vector<Item> read_items_jsonl(const std::filesystem::path& p);

nlohmann::json item_to_json(const Item& it);

// one compact sorted-key object per line, tmp + atomic replace
void write_items_jsonl(const std::filesystem::path& p, const std::vector<Item>& items);
void write_json_lines(const std::filesystem::path& p, const std::vector<nlohmann::json>& rows);

// sorted keys, indent 2, LF, trailing LF
std::string canonical_json(const nlohmann::json& j);
void write_json_canonical(const std::filesystem::path& p, const nlohmann::json& j);

nlohmann::json read_json_file(const std::filesystem::path& p);

// false on open/read failure (err filled when non-null)
bool file_sha256(const std::filesystem::path& p, std::string& out_hex, std::string* err = nullptr);

} // namespace golden
