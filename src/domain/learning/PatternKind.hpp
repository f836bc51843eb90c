/**
 * @file PatternKind.hpp
 * @brief Closed set of behavioural signal kinds tracked by the pattern learning store.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace reflectcore::domain::learning {

enum class PatternKind {
    StylePreference,
    WorkflowPreference,
    TopicRecurrence,
    ResolutionPattern,
    ConstraintsSensitivity,
    NarrativePattern,
    LensPreference,
    ConstraintTrigger,
    ContractionPattern,
    ReleasePattern
};

inline std::string KindToString(PatternKind kind) {
    switch (kind) {
        case PatternKind::StylePreference: return "style_preference";
        case PatternKind::WorkflowPreference: return "workflow_preference";
        case PatternKind::TopicRecurrence: return "topic_recurrence";
        case PatternKind::ResolutionPattern: return "resolution_pattern";
        case PatternKind::ConstraintsSensitivity: return "constraints_sensitivity";
        case PatternKind::NarrativePattern: return "narrative_pattern";
        case PatternKind::LensPreference: return "lens_preference";
        case PatternKind::ConstraintTrigger: return "constraint_trigger";
        case PatternKind::ContractionPattern: return "contraction_pattern";
        case PatternKind::ReleasePattern: return "release_pattern";
        default: return "topic_recurrence";
    }
}

/**
 * @brief Parses a stored kind. Returns nullopt for unknown values; callers skip those rows.
 */
inline std::optional<PatternKind> KindFromString(const std::string& raw) {
    if (raw == "style_preference") return PatternKind::StylePreference;
    if (raw == "workflow_preference") return PatternKind::WorkflowPreference;
    if (raw == "topic_recurrence") return PatternKind::TopicRecurrence;
    if (raw == "resolution_pattern") return PatternKind::ResolutionPattern;
    if (raw == "constraints_sensitivity") return PatternKind::ConstraintsSensitivity;
    if (raw == "narrative_pattern") return PatternKind::NarrativePattern;
    if (raw == "lens_preference") return PatternKind::LensPreference;
    if (raw == "constraint_trigger") return PatternKind::ConstraintTrigger;
    if (raw == "contraction_pattern") return PatternKind::ContractionPattern;
    if (raw == "release_pattern") return PatternKind::ReleasePattern;
    return std::nullopt;
}

inline const std::vector<PatternKind>& AllPatternKinds() {
    static const std::vector<PatternKind> kinds = {
        PatternKind::StylePreference, PatternKind::WorkflowPreference, PatternKind::TopicRecurrence,
        PatternKind::ResolutionPattern, PatternKind::ConstraintsSensitivity, PatternKind::NarrativePattern,
        PatternKind::LensPreference, PatternKind::ConstraintTrigger, PatternKind::ContractionPattern,
        PatternKind::ReleasePattern
    };
    return kinds;
}

} // namespace reflectcore::domain::learning
