/**
 * @file LearningSync.hpp
 * @brief Curates ranked pattern rows into the Capsule's learned tendencies.
 */

#pragma once

#include <optional>
#include <vector>
#include "application/learning/PatternLearningService.hpp"
#include "domain/capsule/Capsule.hpp"

namespace reflectcore::application::capsule {

using domain::Timestamp;
using domain::capsule::CapsuleTendency;
using learning::RankedPattern;

/**
 * @class LearningSync
 * @brief Threshold and lane selection for learned tendencies.
 *
 * Rows are split into three lanes:
 * - sticky: stable traits (situational triggers, sensory noise, lighter questioning)
 * - seasonal: everything that is neither sticky nor ephemeral
 * - ephemeral: short-lived states (release phrases, sleep/energy/deadline signals); these
 *   must also be recent and stronger than the base threshold
 *
 * Each lane keeps at most 6 rows per kind and has its own cap (8 / 10 / 4). The result is
 * ordered sticky, seasonal, ephemeral and never exceeds 24 entries.
 */
class LearningSync {
public:
    static constexpr std::size_t kStickyCap = 8;
    static constexpr std::size_t kSeasonalCap = 10;
    static constexpr std::size_t kEphemeralCap = 4;
    static constexpr std::size_t kGlobalCap = 24;
    static constexpr std::size_t kMaxPerKindWithinLane = 6;
    static constexpr double kEphemeralRecencyDays = 7.0;

    /**
     * @brief Projects @p ranked (decayed as of @p now) into tendencies.
     * Rows last seen at or before @p resetAt are ignored.
     */
    static std::vector<CapsuleTendency> project(const std::vector<RankedPattern>& ranked,
                                                std::optional<Timestamp> resetAt,
                                                Timestamp now);

    /**
     * @brief Order-insensitive comparison used to skip redundant capsule writes.
     */
    static bool equivalent(const std::vector<CapsuleTendency>& a, const std::vector<CapsuleTendency>& b);
};

} // namespace reflectcore::application::capsule
