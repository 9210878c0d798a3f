// Golden/cpp/src/format.cpp
#include "golden/format.h"
#include "golden/errors.h"

#include <cmath>
#include <iostream>

#include <openssl/evp.h>

namespace golden {

const char* error_code_name(ErrorCode c) {
    switch (c) {
        case ErrorCode::Ok:               return "ok";
        case ErrorCode::IoError:          return "io_error";
        case ErrorCode::ParseError:       return "parse_error";
        case ErrorCode::InvalidFormat:    return "invalid_format";
        case ErrorCode::InvalidArgs:      return "invalid_args";
        case ErrorCode::InvalidConfig:    return "invalid_config";
        case ErrorCode::ValidationFailed: return "validation_failed";
        case ErrorCode::QuotaUnmet:       return "quota_unmet";
        case ErrorCode::SynthesisFailed:  return "synthesis_failed";
    }
    return "unknown";
}

double round4(double v) {
    return std::round(v * 10000.0) / 10000.0;
}

std::string sha256_hex(std::string_view data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha256(), nullptr) != 1) {
        throw GoldenException(ErrorCode::IoError, "EVP_Digest(sha256) failed");
    }

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve((size_t)md_len * 2);
    for (unsigned int i = 0; i < md_len; ++i) {
        out.push_back(hex[(md[i] >> 4) & 0xF]);
        out.push_back(hex[md[i] & 0xF]);
    }
    return out;
}

uint64_t seed_for(std::initializer_list<std::string> parts) {
    std::string key;
    bool first = true;
    for (const auto& p : parts) {
        if (!first) key.push_back('|');
        first = false;
        key += p;
    }
    const std::string h = sha256_hex(key);
    return std::stoull(h.substr(0, 8), nullptr, 16);
}

uint64_t regeneration_seed(uint64_t base_seed,
                           const std::string& archetype,
                           const std::string& complexity,
                           int attempt) {
    return seed_for({std::to_string(base_seed), archetype, complexity, std::to_string(attempt)});
}

bool atomic_replace_file_best_effort(const std::filesystem::path& tmp,
                                     const std::filesystem::path& fin) {
    try {
        std::error_code ec;
        std::filesystem::create_directories(fin.parent_path(), ec);

        std::filesystem::rename(tmp, fin, ec);
        if (!ec) return true;

        std::filesystem::remove(fin, ec);
        ec.clear();
        std::filesystem::rename(tmp, fin, ec);
        if (!ec) return true;

        std::cerr << "[golden] atomic_replace failed: " << ec.message()
                  << " tmp=" << tmp << " fin=" << fin << "\n";
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[golden] atomic_replace exception: " << e.what()
                  << " tmp=" << tmp << " fin=" << fin << "\n";
        return false;
    }
}

} // namespace golden
