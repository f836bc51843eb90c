/**
 * @file Fingerprint.hpp
 * @brief Fast, stable, non-cryptographic content fingerprinting (64-bit FNV-1a).
 *
 * Used for change detection (redaction re-apply) and debug tracing only.
 * Collisions are tolerable; never use this as a security boundary.
 */

#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

namespace reflectcore::domain {

constexpr std::uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kFnvPrime = 0x100000001b3ULL;

/**
 * @brief Computes the FNV-1a 64-bit hash of the raw bytes of @p text.
 */
inline std::uint64_t Fnv1a64(const std::string& text) {
    std::uint64_t hash = kFnvOffsetBasis;
    for (unsigned char c : text) {
        hash ^= static_cast<std::uint64_t>(c);
        hash *= kFnvPrime;
    }
    return hash;
}

/**
 * @brief FNV-1a 64 rendered as 16 lowercase hex digits.
 */
inline std::string Fingerprint(const std::string& text) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(Fnv1a64(text)));
    return std::string(buf);
}

} // namespace reflectcore::domain
