/**
 * @file ExportSnapshot.hpp
 * @brief Bounded, sanitized projection of the Capsule for one outbound request. Never persisted.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace reflectcore::domain::capsule {

enum class CapsuleMode {
    Reflect,    ///< Single-shot tools.
    Talk        ///< Multi-turn continuation.
};

inline std::string ModeToString(CapsuleMode mode) {
    return mode == CapsuleMode::Talk ? "talk" : "reflect";
}

struct LearnedCue {
    std::string statement;
    int evidenceCount = 1;
    std::string lastSeenAtISO;
    std::optional<std::string> kindRaw;
    std::optional<std::string> key;
};

struct ExportSnapshot {
    CapsuleMode mode = CapsuleMode::Reflect;
    int version = 1;
    std::string updatedAtISO;

    /// Sorted by key. At most 24 entries.
    std::vector<std::pair<std::string, std::string>> preferences;

    /// Absent (not empty) when learning is disabled or nothing qualifies.
    std::optional<std::vector<LearnedCue>> learnedCues;
};

} // namespace reflectcore::domain::capsule
