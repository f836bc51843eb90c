/**
 * @file SnapshotExporter.cpp
 * @brief Implementation of SnapshotExporter.
 */

#include "application/capsule/SnapshotExporter.hpp"
#include <algorithm>
#include <iostream>
#include <set>
#include <sstream>
#include <nlohmann/json.hpp>
#include "application/capsule/LearningSync.hpp"
#include "domain/Fingerprint.hpp"
#include "domain/TextUtils.hpp"

namespace reflectcore::application::capsule {

using domain::Trim;
using domain::TruncateUtf8;
using domain::capsule::CapsuleTendency;
using domain::capsule::LearnedCue;

namespace {

std::string BoolText(bool v) {
    return v ? "true" : "false";
}

// Compact JSON array text, e.g. ["a","b"].
std::string EncodeList(const std::vector<std::string>& values) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& v : values) {
        std::string item = Trim(v);
        if (!item.empty()) array.push_back(std::move(item));
    }
    if (array.empty()) return "";
    return array.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

ExportSnapshot SnapshotExporter::project(const Capsule& capsule, CapsuleMode mode) noexcept {
    try {
        return build(capsule, mode, capsule.learnedTendencies);
    } catch (const std::exception& e) {
        std::cerr << "[SnapshotExporter] Projection failed, exporting header only: " << e.what() << std::endl;
        ExportSnapshot minimal;
        minimal.mode = mode;
        minimal.version = capsule.version;
        return minimal;
    }
}

ExportSnapshot SnapshotExporter::project(const Capsule& capsule, CapsuleMode mode,
                                         const std::vector<learning::RankedPattern>& patterns,
                                         Timestamp now) noexcept {
    try {
        std::vector<CapsuleTendency> curated;
        if (capsule.learningEnabled) {
            curated = LearningSync::project(patterns, capsule.learningResetAt, now);
        }
        return build(capsule, mode, curated);
    } catch (const std::exception& e) {
        std::cerr << "[SnapshotExporter] Projection failed, exporting header only: " << e.what() << std::endl;
        ExportSnapshot minimal;
        minimal.mode = mode;
        minimal.version = capsule.version;
        return minimal;
    }
}

ExportSnapshot SnapshotExporter::build(const Capsule& capsule, CapsuleMode mode,
                                       const std::vector<CapsuleTendency>& tendencies) {
    ExportSnapshot snap;
    snap.mode = mode;
    snap.version = capsule.version;
    snap.updatedAtISO = domain::ToIso8601(capsule.updatedAt);

    // Typed core
    const auto& prefs = capsule.preferences;
    std::vector<std::pair<std::string, std::string>> entries;
    if (prefs.outputStyle) {
        std::string v = TruncateUtf8(Trim(*prefs.outputStyle), kMaxValueLength);
        if (!v.empty()) entries.emplace_back("output_style", v);
    }
    if (prefs.optionsBeforeQuestions) entries.emplace_back("options_before_questions", BoolText(*prefs.optionsBeforeQuestions));
    if (prefs.noTherapyFraming) entries.emplace_back("no_therapy_framing", BoolText(*prefs.noTherapyFraming));
    if (prefs.noPersona) entries.emplace_back("no_persona", BoolText(*prefs.noPersona));
    for (const auto& [list, values] : prefs.lists) {
        std::string v = TruncateUtf8(EncodeList(values), kMaxListValueLength);
        if (!v.empty()) entries.emplace_back(domain::capsule::ListPreferenceKey(list), v);
    }

    std::set<std::string> used;
    for (const auto& e : entries) used.insert(e.first);

    // Extras (std::map iterates in key order)
    for (const auto& [rawKey, rawValue] : prefs.extras) {
        if (entries.size() >= kMaxPreferences) break;
        std::string key = TruncateUtf8(Trim(rawKey), kMaxKeyLength);
        std::string value = TruncateUtf8(Trim(rawValue), kMaxValueLength);
        if (key.empty() || Trim(value).empty()) continue;
        if (!used.insert(key).second) continue;
        entries.emplace_back(std::move(key), std::move(value));
    }

    std::sort(entries.begin(), entries.end());
    snap.preferences = std::move(entries);

    // Learned cues
    if (!capsule.learningEnabled || tendencies.empty()) return snap;

    const std::size_t cap = mode == CapsuleMode::Talk ? kMaxTalkCues : kMaxReflectCues;
    std::vector<LearnedCue> cues;
    for (const auto& t : tendencies) {
        if (cues.size() >= cap) break;
        if (t.isOverridden) continue;
        std::string statement = TruncateUtf8(Trim(t.statement), kMaxStatementLength);
        if (statement.empty()) continue;

        LearnedCue cue;
        cue.statement = std::move(statement);
        cue.evidenceCount = std::clamp(t.evidenceCount, 1, kMaxEvidenceCount);
        cue.lastSeenAtISO = domain::ToIso8601(t.lastSeenAt);
        cue.kindRaw = t.sourceKind;
        cue.key = t.sourceKey;
        cues.push_back(std::move(cue));
    }
    if (!cues.empty()) snap.learnedCues = std::move(cues);
    return snap;
}

std::string SnapshotExporter::fingerprint(const ExportSnapshot& snapshot) {
    std::ostringstream canonical;
    canonical << domain::capsule::ModeToString(snapshot.mode) << '\n'
              << snapshot.version << '\n'
              << snapshot.updatedAtISO << '\n';
    for (const auto& [k, v] : snapshot.preferences) {
        canonical << k << '=' << v << '\n';
    }
    if (snapshot.learnedCues) {
        for (const auto& c : *snapshot.learnedCues) {
            canonical << c.statement << '|' << c.evidenceCount << '|' << c.lastSeenAtISO << '|'
                      << c.kindRaw.value_or("") << '|' << c.key.value_or("") << '\n';
        }
    }
    return domain::Fingerprint(canonical.str());
}

} // namespace reflectcore::application::capsule
