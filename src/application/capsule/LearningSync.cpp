/**
 * @file LearningSync.cpp
 * @brief Implementation of LearningSync.
 */

#include "application/capsule/LearningSync.hpp"
#include <algorithm>
#include <map>
#include <tuple>
#include "application/capsule/TendencyStatements.hpp"

namespace reflectcore::application::capsule {

using domain::learning::KindToString;
using domain::learning::PatternKind;

namespace {

enum class Lane { Sticky, Seasonal, Ephemeral };

bool Contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

bool IsAdaptationKey(const std::string& key) {
    return key == "question_light" || key == "question_guided" ||
           key == "narrow_first" || key == "explore_space";
}

bool PassesBaseThreshold(const RankedPattern& r) {
    const auto& s = r.stat;
    switch (s.kind) {
        case PatternKind::ConstraintsSensitivity:
            return r.currentScore >= 0.6 && s.count >= 2;
        case PatternKind::WorkflowPreference:
            if (IsAdaptationKey(s.key)) return r.currentScore >= 0.4 && s.count >= 2;
            return r.currentScore >= 0.3;
        default:
            return r.currentScore >= 0.3;
    }
}

Lane LaneFor(const RankedPattern& r) {
    const auto& s = r.stat;
    if (s.kind == PatternKind::ReleasePattern) return Lane::Ephemeral;
    if (s.kind == PatternKind::ConstraintTrigger &&
        (Contains(s.key, "low_sleep") || Contains(s.key, "low_energy") || Contains(s.key, "deadline_pressure"))) {
        return Lane::Ephemeral;
    }
    if (s.kind == PatternKind::ConstraintsSensitivity &&
        (s.key == "time_pressure" || s.key == "low_energy")) {
        return Lane::Ephemeral;
    }

    if (s.kind == PatternKind::ConstraintTrigger) return Lane::Sticky;
    if (s.kind == PatternKind::ConstraintsSensitivity && s.key == "sensory_noise") return Lane::Sticky;
    if (s.kind == PatternKind::WorkflowPreference && s.key == "question_light") return Lane::Sticky;

    return Lane::Seasonal;
}

bool PassesEphemeralGate(const RankedPattern& r, Timestamp now) {
    if (domain::DaysBetween(r.stat.lastSeenAt, now) > LearningSync::kEphemeralRecencyDays) return false;
    switch (r.stat.kind) {
        case PatternKind::ReleasePattern:
            return r.currentScore >= 0.4;
        case PatternKind::ConstraintTrigger:
            return r.currentScore >= 0.5 && r.stat.count >= 2;
        case PatternKind::ConstraintsSensitivity:
            return r.currentScore >= 0.6 && r.stat.count >= 2;
        default:
            return r.currentScore >= 0.5;
    }
}

bool Stronger(const RankedPattern& a, const RankedPattern& b) {
    if (a.currentScore != b.currentScore) return a.currentScore > b.currentScore;
    if (a.stat.lastSeenAt != b.stat.lastSeenAt) return a.stat.lastSeenAt > b.stat.lastSeenAt;
    return a.stat.compositeKey() < b.stat.compositeKey();
}

std::vector<RankedPattern> SelectLane(const std::vector<RankedPattern>& candidates, std::size_t cap) {
    if (cap == 0 || candidates.empty()) return {};

    std::map<PatternKind, std::vector<RankedPattern>> perKind;
    for (const auto& r : candidates) perKind[r.stat.kind].push_back(r);

    std::vector<RankedPattern> flattened;
    for (auto& [_, rows] : perKind) {
        std::sort(rows.begin(), rows.end(), Stronger);
        if (rows.size() > LearningSync::kMaxPerKindWithinLane) rows.resize(LearningSync::kMaxPerKindWithinLane);
        flattened.insert(flattened.end(), rows.begin(), rows.end());
    }
    std::sort(flattened.begin(), flattened.end(), Stronger);
    if (flattened.size() > cap) flattened.resize(cap);
    return flattened;
}

using TendencyKey = std::tuple<std::string, int, long long, long long, bool, std::string, std::string>;

std::vector<TendencyKey> Normalise(const std::vector<CapsuleTendency>& items) {
    std::vector<TendencyKey> out;
    out.reserve(items.size());
    for (const auto& t : items) {
        out.emplace_back(t.statement, t.evidenceCount,
                         domain::ToEpochMillis(t.firstSeenAt), domain::ToEpochMillis(t.lastSeenAt),
                         t.isOverridden, t.sourceKind.value_or(""), t.sourceKey.value_or(""));
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

std::vector<CapsuleTendency> LearningSync::project(const std::vector<RankedPattern>& ranked,
                                                   std::optional<Timestamp> resetAt,
                                                   Timestamp now) {
    std::vector<RankedPattern> sticky;
    std::vector<RankedPattern> seasonal;
    std::vector<RankedPattern> ephemeral;

    for (const auto& r : ranked) {
        if (resetAt && r.stat.lastSeenAt <= *resetAt) continue;
        // Too easily misread when repeated back; kept in the store, never surfaced.
        if (r.stat.kind == PatternKind::ConstraintTrigger && r.stat.key == "trigger:eye_contact") continue;
        if (!PassesBaseThreshold(r)) continue;

        switch (LaneFor(r)) {
            case Lane::Sticky:
                sticky.push_back(r);
                break;
            case Lane::Seasonal:
                seasonal.push_back(r);
                break;
            case Lane::Ephemeral:
                if (PassesEphemeralGate(r, now)) ephemeral.push_back(r);
                break;
        }
    }

    std::vector<RankedPattern> combined = SelectLane(sticky, kStickyCap);
    auto chosenSeasonal = SelectLane(seasonal, kSeasonalCap);
    auto chosenEphemeral = SelectLane(ephemeral, kEphemeralCap);
    combined.insert(combined.end(), chosenSeasonal.begin(), chosenSeasonal.end());
    combined.insert(combined.end(), chosenEphemeral.begin(), chosenEphemeral.end());

    if (combined.size() > kGlobalCap) {
        std::sort(combined.begin(), combined.end(), Stronger);
        combined.resize(kGlobalCap);
    }

    std::vector<CapsuleTendency> out;
    out.reserve(combined.size());
    for (const auto& r : combined) {
        CapsuleTendency t;
        t.statement = StatementFor(r.stat.kind, r.stat.key);
        t.evidenceCount = r.stat.count;
        t.firstSeenAt = r.stat.firstSeenAt;
        t.lastSeenAt = r.stat.lastSeenAt;
        t.isOverridden = false;
        t.sourceKind = KindToString(r.stat.kind);
        t.sourceKey = r.stat.key;
        out.push_back(std::move(t));
    }
    return out;
}

bool LearningSync::equivalent(const std::vector<CapsuleTendency>& a, const std::vector<CapsuleTendency>& b) {
    if (a.size() != b.size()) return false;
    return Normalise(a) == Normalise(b);
}

} // namespace reflectcore::application::capsule
