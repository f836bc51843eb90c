/**
 * @file HalfLifePolicy.hpp
 * @brief Decay rate per (kind, key).
 *
 * Sticky items (situational triggers, hard preferences) decay over months,
 * evolving preferences over a season, and day-state signals within a week.
 */

#pragma once

#include <string>
#include "domain/learning/PatternKind.hpp"
#include "domain/learning/PatternStat.hpp"

namespace reflectcore::application::learning {

using domain::learning::PatternKind;

inline double HalfLifeDaysFor(PatternKind kind, const std::string& key,
                              double defaultDays = domain::learning::kDefaultHalfLifeDays) {
    auto has = [&](const char* needle) { return key.find(needle) != std::string::npos; };
    auto startsWith = [&](const char* prefix) { return key.rfind(prefix, 0) == 0; };

    // Ephemeral
    if (startsWith("release:")) return 7.0;
    if (has("deadline") || has("time_pressure")) return 7.0;
    if (has("low_energy") || has("low_sleep")) return 7.0;

    // Sticky
    if (kind == PatternKind::ConstraintTrigger || startsWith("trigger:")) return 365.0;
    if (key == "question_light") return 180.0;
    if (key == "prefers_no_fluff") return 120.0;

    // Seasonal
    if (kind == PatternKind::StylePreference || kind == PatternKind::WorkflowPreference) return 90.0;

    return defaultDays;
}

} // namespace reflectcore::application::learning
