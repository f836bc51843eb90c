/**
 * @file PatternLearner.hpp
 * @brief Derives pattern observations from redacted transcript text using explicit phrases only.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/learning/PatternKind.hpp"

namespace reflectcore::application::learning {

using domain::learning::PatternKind;

struct PatternObservation {
    PatternKind kind;
    std::string key;
    double strength; ///< Positive reinforces; negative explicitly deactivates.
};

/**
 * @class PatternLearner
 * @brief Stateless phrase matcher. Nothing is inferred from silence; only stated
 * preferences, constraints and relief are observed.
 */
class PatternLearner {
public:
    static constexpr std::size_t kMaxObservationsPerTurn = 12;

    /**
     * @brief Observations for one Turn, deduplicated per (kind, key) keeping the strongest,
     * ordered by strength then key, and capped at kMaxObservationsPerTurn.
     */
    std::vector<PatternObservation> derive(const std::string& redactedText) const;

    /**
     * @brief Compact JSON record of the observations, stored on the Turn as its learning snapshot.
     */
    static std::string ToSnapshotJson(const std::vector<PatternObservation>& observations);

private:
    std::vector<PatternObservation> deriveRelease(const std::string& text) const;
    std::vector<PatternObservation> deriveSituationalConstraints(const std::string& text) const;
    std::vector<PatternObservation> deriveQuestionAndBreadth(const std::string& text) const;
    std::vector<PatternObservation> deriveProfileSignals(const std::string& text) const;
    std::vector<PatternObservation> deriveDeactivations(const std::string& text) const;
};

} // namespace reflectcore::application::learning
