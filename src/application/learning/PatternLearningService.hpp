/**
 * @file PatternLearningService.hpp
 * @brief Decay-scored model of recurring behavioural signals.
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/KeyedMutex.hpp"
#include "application/learning/PatternLearner.hpp"
#include "domain/learning/PatternStatRepository.hpp"

namespace reflectcore::application::learning {

using domain::Timestamp;
using domain::learning::PatternStat;

/**
 * @struct RankedPattern
 * @brief A stored row together with its score as of the query time.
 */
struct RankedPattern {
    PatternStat stat;
    double currentScore = 0.0;
};

/**
 * @class PatternLearningService
 * @brief Process-wide pattern learning store.
 *
 * Decay is applied lazily: stored scores change only in observe(); reads compute the score
 * as of the requested instant. Observations of the same (kind, key) are serialized.
 */
class PatternLearningService {
public:
    explicit PatternLearningService(std::shared_ptr<domain::learning::PatternStatRepository> repository,
                                    double defaultHalfLifeDays = domain::learning::kDefaultHalfLifeDays);

    /**
     * @brief Decays the existing score to @p now, adds @p weight, increments the count and
     * refreshes last-seen. Creates the row (score = weight) on first sight.
     *
     * Negative weights deactivate: the score is floored at zero and no row is created.
     * Ignored while learning is disabled.
     * @throws domain::ValidationError for a blank key.
     * @return The row as written, or nullopt if nothing was written.
     */
    std::optional<PatternStat> observe(PatternKind kind, const std::string& key, double weight, Timestamp now);
    std::optional<PatternStat> observe(PatternKind kind, const std::string& key, Timestamp now) {
        return observe(kind, key, 1.0, now);
    }

    /**
     * @brief Derives explicit-phrase observations from redacted text and applies them.
     * @return The observations derived (empty while learning is disabled).
     */
    std::vector<PatternObservation> learnFromText(const std::string& redactedText, Timestamp now);

    /**
     * @brief The @p limit highest rows by decayed score, optionally filtered by kind.
     * Ties are broken by most recent lastSeenAt, then key.
     */
    std::vector<RankedPattern> topPatterns(std::optional<PatternKind> kind, std::size_t limit, Timestamp now);

    /**
     * @brief All rows ranked as in topPatterns.
     */
    std::vector<RankedPattern> rankedPatterns(Timestamp now);

    /**
     * @brief Deletes every row.
     */
    void reset();

    void setLearningEnabled(bool enabled) { m_learningEnabled = enabled; }
    bool isLearningEnabled() const { return m_learningEnabled; }

private:
    std::shared_ptr<domain::learning::PatternStatRepository> m_repository;
    double m_defaultHalfLifeDays;
    PatternLearner m_learner;
    KeyedMutex m_locks;
    std::atomic<bool> m_learningEnabled{true};
};

} // namespace reflectcore::application::learning
