// Golden/cpp/include/golden/format.h
#pragma once

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>

namespace golden {

constexpr int K_SHINGLE = 3;
constexpr int DEFAULT_NUM_PERM = 128;
constexpr uint64_t DEFAULT_SEED = 2025;

// round half away from zero to 4 decimals (report precision)
double round4(double v);

// lowercase hex SHA-256
std::string sha256_hex(std::string_view data);

// Stable seed derivation: sha256("p0|p1|...")[:8] read as hex integer.
// Re-ordering pipeline stages cannot change the value (no generator state).
uint64_t seed_for(std::initializer_list<std::string> parts);

uint64_t regeneration_seed(uint64_t base_seed,
                           const std::string& archetype,
                           const std::string& complexity,
                           int attempt);

bool atomic_replace_file_best_effort(const std::filesystem::path& tmp,
                                     const std::filesystem::path& fin);

} // namespace golden
