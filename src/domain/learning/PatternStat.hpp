/**
 * @file PatternStat.hpp
 * @brief One decay-scored behavioural signal bucket, keyed by (kind, key).
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <string>
#include "domain/TimeFormat.hpp"
#include "domain/learning/PatternKind.hpp"

namespace reflectcore::domain::learning {

constexpr std::size_t kMaxPatternKeyLength = 96;
constexpr double kDefaultHalfLifeDays = 14.0;

/**
 * @struct PatternStat
 * @brief Stored row. @c score is the value as of @c lastSeenAt; read it through decayedScore().
 */
struct PatternStat {
    PatternKind kind = PatternKind::TopicRecurrence;
    std::string key;
    double score = 0.0;
    int count = 0;
    Timestamp firstSeenAt;
    Timestamp lastSeenAt;
    double halfLifeDays = kDefaultHalfLifeDays;

    /**
     * @brief Score as of @p now: score * 2^(-elapsedDays / halfLife). Pure; never mutates.
     * Elapsed time is clamped at zero, half-life at one day.
     */
    double decayedScore(Timestamp now) const {
        double days = DaysBetween(lastSeenAt, now);
        double hl = std::max(1.0, halfLifeDays);
        return score * std::pow(0.5, days / hl);
    }

    std::string compositeKey() const {
        return KindToString(kind) + "|" + key;
    }
};

} // namespace reflectcore::domain::learning
