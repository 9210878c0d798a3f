// Golden/cpp/common/text_common.h
#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Нормализация спецификаций перед шинглами (порядок фиксирован):
// - HTML entities -> текст, теги выкидываем
// - YAML front-matter в начале документа
// - строки "## ..." (H2)
// - литералы платформы (replit.toml, replit.nix, 0.0.0.0)
// - fenced code (```...```) целиком
std::string normalize_spec_text(std::string_view s);

std::string html_unescape(std::string_view s);
std::string strip_yaml_frontmatter(std::string_view s);
std::string strip_h2_headers(std::string_view s);
std::string strip_literals(std::string_view s, const std::vector<std::string>& literals);
std::string strip_fenced_code(std::string_view s);

const std::vector<std::string>& boilerplate_literals();

// Lowercase ASCII word tokens [a-z0-9_]+, everything else is a separator.
void tokenize_words_to(std::string_view s, std::vector<std::string>& out);
std::vector<std::string> tokenize_words(std::string_view s);

// Stride-1 word n-grams joined by ' ', max(0, len - n + 1) of them.
std::vector<std::string> word_shingles(const std::vector<std::string>& tokens, int n);

// FNV-1a 64-bit
uint64_t fnv1a64(std::string_view s);
