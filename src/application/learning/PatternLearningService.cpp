/**
 * @file PatternLearningService.cpp
 * @brief Implementation of PatternLearningService.
 */

#include "application/learning/PatternLearningService.hpp"
#include "application/learning/HalfLifePolicy.hpp"
#include "domain/DomainErrors.hpp"
#include <algorithm>
#include <iostream>

namespace reflectcore::application::learning {

using domain::learning::kMaxPatternKeyLength;

namespace {

std::string NormalizeKey(const std::string& key) {
    auto start = key.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = key.find_last_not_of(" \t\n\r");
    std::string trimmed = key.substr(start, end - start + 1);
    if (trimmed.size() > kMaxPatternKeyLength) trimmed.resize(kMaxPatternKeyLength);
    return trimmed;
}

bool RanksBefore(const RankedPattern& a, const RankedPattern& b) {
    if (a.currentScore != b.currentScore) return a.currentScore > b.currentScore;
    if (a.stat.lastSeenAt != b.stat.lastSeenAt) return a.stat.lastSeenAt > b.stat.lastSeenAt;
    return a.stat.compositeKey() < b.stat.compositeKey();
}

} // namespace

PatternLearningService::PatternLearningService(std::shared_ptr<domain::learning::PatternStatRepository> repository,
                                               double defaultHalfLifeDays)
    : m_repository(std::move(repository)), m_defaultHalfLifeDays(defaultHalfLifeDays) {}

std::optional<PatternStat> PatternLearningService::observe(PatternKind kind, const std::string& key,
                                                          double weight, Timestamp now) {
    std::string normalized = NormalizeKey(key);
    if (normalized.empty()) {
        throw domain::ValidationError("Pattern key must not be blank");
    }
    if (!m_learningEnabled) {
        return std::nullopt;
    }

    auto guard = m_locks.lock(domain::learning::KindToString(kind) + "|" + normalized);

    double halfLife = HalfLifeDaysFor(kind, normalized, m_defaultHalfLifeDays);
    auto existing = m_repository->find(kind, normalized);

    PatternStat stat;
    if (existing) {
        stat = *existing;
        double decayed = stat.decayedScore(now);
        stat.score = std::max(0.0, decayed + weight);
        stat.count += 1;
        stat.lastSeenAt = now;
        stat.halfLifeDays = halfLife;
    } else {
        if (weight <= 0.0) {
            return std::nullopt;
        }
        stat.kind = kind;
        stat.key = normalized;
        stat.score = weight;
        stat.count = 1;
        stat.firstSeenAt = now;
        stat.lastSeenAt = now;
        stat.halfLifeDays = halfLife;
    }

    m_repository->upsert(stat);
    return stat;
}

std::vector<PatternObservation> PatternLearningService::learnFromText(const std::string& redactedText, Timestamp now) {
    if (!m_learningEnabled) return {};

    auto observations = m_learner.derive(redactedText);
    for (const auto& o : observations) {
        observe(o.kind, o.key, o.strength, now);
    }
    if (!observations.empty()) {
        std::cout << "[PatternLearning] Applied " << observations.size() << " observation(s)" << std::endl;
    }
    return observations;
}

std::vector<RankedPattern> PatternLearningService::rankedPatterns(Timestamp now) {
    std::vector<RankedPattern> ranked;
    for (auto& stat : m_repository->findAll()) {
        double score = stat.decayedScore(now);
        ranked.push_back({std::move(stat), score});
    }
    std::sort(ranked.begin(), ranked.end(), RanksBefore);
    return ranked;
}

std::vector<RankedPattern> PatternLearningService::topPatterns(std::optional<PatternKind> kind,
                                                              std::size_t limit, Timestamp now) {
    std::vector<RankedPattern> out;
    for (auto& r : rankedPatterns(now)) {
        if (out.size() >= limit) break;
        if (kind && r.stat.kind != *kind) continue;
        out.push_back(std::move(r));
    }
    return out;
}

void PatternLearningService::reset() {
    m_repository->removeAll();
    std::cout << "[PatternLearning] Cleared all pattern statistics" << std::endl;
}

} // namespace reflectcore::application::learning
