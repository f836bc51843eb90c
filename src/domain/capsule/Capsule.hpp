/**
 * @file Capsule.hpp
 * @brief Singleton preference/learning aggregate.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "domain/TimeFormat.hpp"

namespace reflectcore::domain::capsule {

/**
 * @enum ListPreference
 * @brief Typed multi-select preferences, stored apart from the extras map.
 */
enum class ListPreference {
    Practices,
    Figures,
    Terms,
    Milestones
};

inline const std::vector<ListPreference>& AllListPreferences() {
    static const std::vector<ListPreference> all = {
        ListPreference::Practices, ListPreference::Figures, ListPreference::Terms, ListPreference::Milestones};
    return all;
}

inline std::string ListPreferenceKey(ListPreference p) {
    switch (p) {
        case ListPreference::Practices: return "practice:practices";
        case ListPreference::Figures: return "practice:figures";
        case ListPreference::Terms: return "practice:terms";
        case ListPreference::Milestones: return "practice:milestones";
    }
    return "practice:practices";
}

inline std::optional<ListPreference> ListPreferenceFromKey(const std::string& key) {
    for (ListPreference p : AllListPreferences()) {
        if (ListPreferenceKey(p) == key) return p;
    }
    return std::nullopt;
}

/**
 * @struct CapsulePreferences
 * @brief Explicit user settings: a typed core with stable keys plus bounded free-form extras.
 */
struct CapsulePreferences {
    std::optional<std::string> outputStyle;        ///< e.g. "bullets"
    std::optional<bool> optionsBeforeQuestions;
    std::optional<bool> noTherapyFraming;
    std::optional<bool> noPersona;
    std::optional<std::string> pseudonym;          ///< Local display only; never exported.

    /// Never holds an empty list; clearing a list removes its entry.
    std::map<ListPreference, std::vector<std::string>> lists;

    std::map<std::string, std::string> extras;
};

/**
 * @struct CapsuleTendency
 * @brief Human-readable learned tendency derived from a PatternStat.
 */
struct CapsuleTendency {
    std::string statement;
    int evidenceCount = 1;
    Timestamp firstSeenAt;
    Timestamp lastSeenAt;
    bool isOverridden = false;
    std::optional<std::string> sourceKind;
    std::optional<std::string> sourceKey;
};

struct Capsule {
    int version = 1;
    bool learningEnabled = true;
    Timestamp updatedAt;

    CapsulePreferences preferences;
    std::vector<CapsuleTendency> learnedTendencies;

    /// Stats last seen at or before this instant are suppressed from projection.
    std::optional<Timestamp> learningResetAt;

    static Capsule Empty(Timestamp now) {
        Capsule c;
        c.updatedAt = now;
        return c;
    }
};

/**
 * @struct PreferenceEdits
 * @brief Partial update for Capsule preferences. Unset fields are left untouched.
 *
 * Typed fields use a nested optional: outer set means "edit", inner nullopt means "clear".
 * A list edit replaces the whole list, and an empty list clears it.
 * Extras with an empty value are removed.
 */
struct PreferenceEdits {
    std::optional<std::optional<std::string>> outputStyle;
    std::optional<std::optional<bool>> optionsBeforeQuestions;
    std::optional<std::optional<bool>> noTherapyFraming;
    std::optional<std::optional<bool>> noPersona;
    std::optional<std::optional<std::string>> pseudonym;
    std::map<ListPreference, std::vector<std::string>> lists;
    std::map<std::string, std::string> extras;
};

class CapsuleRepository {
public:
    virtual ~CapsuleRepository() = default;

    virtual std::optional<Capsule> load() = 0;
    virtual void save(const Capsule& capsule) = 0;
};

} // namespace reflectcore::domain::capsule
