/**
 * @file CapsuleService.hpp
 * @brief Owner of the singleton Capsule: explicit preferences, learning gate and learned tendencies.
 */

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "application/learning/PatternLearningService.hpp"
#include "domain/capsule/Capsule.hpp"

namespace reflectcore::application::capsule {

using domain::Timestamp;
using domain::capsule::Capsule;
using domain::capsule::ListPreference;
using domain::capsule::PreferenceEdits;

/**
 * @class CapsuleService
 * @brief Explicitly constructed single-instance service around the Capsule row.
 *
 * The Capsule is created on first access (learning enabled) and never deleted. All reads and
 * writes go through one mutex. The learning gate is mirrored into the PatternLearningService so
 * observations stop while disabled, but stored patterns are kept.
 */
class CapsuleService {
public:
    using Clock = std::function<Timestamp()>;

    static constexpr std::size_t kExtrasMaxItems = 34;
    static constexpr std::size_t kExtrasKeyMax = 64;
    static constexpr std::size_t kExtrasValueMax = 128;
    static constexpr std::size_t kOutputStyleMax = 128;
    static constexpr std::size_t kListMaxItems = 32;

    CapsuleService(std::shared_ptr<domain::capsule::CapsuleRepository> repository,
                   std::shared_ptr<learning::PatternLearningService> patterns,
                   Clock clock = nullptr);

    Capsule get();

    void setLearningEnabled(bool enabled);

    /**
     * @brief Merges typed fields and extras, bumps version and updatedAt.
     * Extras go through the same bounds as setPreference; rejected ones are logged and skipped.
     */
    Capsule update(const PreferenceEdits& edits);

    /**
     * @brief Sets one preference by key. Typed keys (output_style, options_before_questions,
     * no_therapy_framing, no_persona, pseudonym) are parsed; anything else becomes an extra.
     * List keys (practice:practices, practice:figures, practice:terms, practice:milestones)
     * take a JSON array of strings or comma-separated text.
     * An empty value removes the preference.
     * @return false if the key or value was rejected (bad key, unparsable bool, extras full).
     */
    bool setPreference(const std::string& key, const std::string& value);
    bool removePreference(const std::string& key);

    /**
     * @brief Replaces a list preference with the normalised @p values and drops any extra
     * stored under the same key. An empty result clears the list.
     */
    void setList(ListPreference list, const std::vector<std::string>& values);
    std::vector<std::string> list(ListPreference which);

    /**
     * @brief Typed entries first, then lists joined with ", ", then extras in key order.
     * Pseudonym is not listed.
     */
    std::vector<std::pair<std::string, std::string>> preferenceKeyValues();

    /**
     * @brief Clears learned tendencies, wipes the pattern store and records the reset instant.
     * Explicit preferences are untouched.
     */
    void resetLearnedProfile();

    /**
     * @brief Replaces the Capsule with an empty one and wipes the pattern store.
     */
    void resetToDefaults();

    /**
     * @brief Recomputes learned tendencies from the pattern store as of @p now.
     * @return true if the stored tendencies changed.
     */
    bool syncLearnedTendencies(Timestamp now);

    static std::string NormaliseKey(const std::string& raw);
    static std::optional<bool> ParseBool(const std::string& raw);
    static bool IsAllowedExtraKey(const std::string& key);

    /// Trims, drops blanks, removes case-insensitive duplicates and sorts case-insensitively.
    static std::vector<std::string> NormaliseList(const std::vector<std::string>& values);
    static std::vector<std::string> DecodeList(const std::string& raw);

private:
    Capsule& loaded();
    void persist();
    bool applyExtra(Capsule& capsule, const std::string& key, const std::string& value);
    static void applyList(Capsule& capsule, ListPreference list, const std::vector<std::string>& values);
    Timestamp now() const;

    std::shared_ptr<domain::capsule::CapsuleRepository> m_repository;
    std::shared_ptr<learning::PatternLearningService> m_patterns;
    Clock m_clock;

    std::mutex m_mutex;
    std::optional<Capsule> m_capsule;
};

} // namespace reflectcore::application::capsule
