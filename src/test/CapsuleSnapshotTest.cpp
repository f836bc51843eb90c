#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <iostream>

#include "application/capsule/CapsuleService.hpp"
#include "application/capsule/LearningSync.hpp"
#include "application/capsule/SnapshotExporter.hpp"
#include "domain/TextUtils.hpp"
#include "infrastructure/CapsuleRepositoryFs.hpp"
#include "infrastructure/PatternStatRepositoryFs.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace reflectcore;
using namespace reflectcore::application::capsule;
using reflectcore::application::learning::PatternLearningService;
using reflectcore::application::learning::RankedPattern;
using reflectcore::domain::capsule::CapsuleTendency;
using reflectcore::domain::learning::PatternKind;

namespace fs = std::filesystem;

namespace {

CapsuleTendency MakeTendency(const std::string& statement, int evidence, domain::Timestamp at) {
    CapsuleTendency t;
    t.statement = statement;
    t.evidenceCount = evidence;
    t.firstSeenAt = at;
    t.lastSeenAt = at;
    t.sourceKind = "style_preference";
    t.sourceKey = "bullets";
    return t;
}

RankedPattern MakeRow(PatternKind kind, const std::string& key, double score, int count, domain::Timestamp lastSeen) {
    RankedPattern r;
    r.stat.kind = kind;
    r.stat.key = key;
    r.stat.score = score;
    r.stat.count = count;
    r.stat.firstSeenAt = lastSeen;
    r.stat.lastSeenAt = lastSeen;
    r.currentScore = score;
    return r;
}

std::optional<std::string> PreferenceValue(const domain::capsule::ExportSnapshot& s, const std::string& key) {
    for (const auto& [k, v] : s.preferences) {
        if (k == key) return v;
    }
    return std::nullopt;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Capsule Snapshot Test..." << std::endl;

    const auto t0 = domain::FromEpochMillis(1700000000000LL);

    // Exporter bounds: 40 oversized extras.
    {
        domain::capsule::Capsule capsule = domain::capsule::Capsule::Empty(t0);
        for (int i = 0; i < 40; ++i) {
            std::string key = "extra_key_" + std::to_string(100 + i) + std::string(30, 'k');
            capsule.preferences.extras[key] = std::string(200, 'v');
        }
        capsule.preferences.extras["zz_blank"] = "   ";
        capsule.preferences.noPersona = true;
        capsule.preferences.optionsBeforeQuestions = false;
        capsule.preferences.pseudonym = "Sam";

        auto snap = SnapshotExporter::project(capsule, CapsuleMode::Reflect);
        assert(snap.preferences.size() <= 24);
        assert(snap.preferences.size() == 24);
        for (const auto& [k, v] : snap.preferences) {
            assert(domain::Utf8Length(k) <= 32);
            assert(domain::Utf8Length(v) <= 128);
            assert(!domain::IsBlank(v));
            assert(k != "pseudonym");
        }
        for (std::size_t i = 1; i < snap.preferences.size(); ++i) {
            assert(snap.preferences[i - 1].first < snap.preferences[i].first);
        }
        assert(PreferenceValue(snap, "no_persona") == std::string("true"));
        assert(PreferenceValue(snap, "options_before_questions") == std::string("false"));
        assert(!PreferenceValue(snap, "output_style"));
        assert(snap.updatedAtISO == domain::ToIso8601(t0));
        std::cout << "[PASS] Preference bounds" << std::endl;
    }

    // List preferences export as compact JSON arrays inside the shared cap.
    {
        using domain::capsule::ListPreference;
        domain::capsule::Capsule capsule = domain::capsule::Capsule::Empty(t0);
        for (int i = 0; i < 40; ++i) {
            capsule.preferences.extras["extra_" + std::to_string(100 + i)] = "v";
        }
        capsule.preferences.lists[ListPreference::Terms] = {"impermanence", "non-self"};
        std::vector<std::string> many;
        for (int i = 0; i < 40; ++i) many.push_back("milestone number " + std::to_string(100 + i) + " reached");
        capsule.preferences.lists[ListPreference::Milestones] = many;

        auto snap = SnapshotExporter::project(capsule, CapsuleMode::Talk);
        assert(snap.preferences.size() == 24);
        assert(PreferenceValue(snap, "practice:terms") == std::string(R"(["impermanence","non-self"])"));
        auto milestones = PreferenceValue(snap, "practice:milestones");
        assert(milestones);
        assert(domain::Utf8Length(*milestones) == 512);
        assert(milestones->rfind(R"(["milestone number 100 reached",)", 0) == 0);
        assert(!PreferenceValue(snap, "practice:practices"));
        std::cout << "[PASS] List preference export" << std::endl;
    }

    // Learned cues: gating, caps and per-cue sanitising.
    {
        domain::capsule::Capsule capsule = domain::capsule::Capsule::Empty(t0);
        for (int i = 0; i < 20; ++i) {
            capsule.learnedTendencies.push_back(MakeTendency("Cue " + std::to_string(i), 3, t0));
        }
        capsule.learnedTendencies[0].statement = "   ";
        capsule.learnedTendencies[1].statement = std::string(300, 's');
        capsule.learnedTendencies[1].evidenceCount = 5000;
        capsule.learnedTendencies[2].evidenceCount = 0;

        auto reflect = SnapshotExporter::project(capsule, CapsuleMode::Reflect);
        assert(reflect.learnedCues && reflect.learnedCues->size() == 12);
        const auto& first = reflect.learnedCues->front();
        assert(domain::Utf8Length(first.statement) == 140);
        assert(first.evidenceCount == 999);
        assert((*reflect.learnedCues)[1].evidenceCount == 1);
        assert(first.lastSeenAtISO == domain::ToIso8601(t0));
        assert(first.kindRaw == std::string("style_preference"));

        auto talk = SnapshotExporter::project(capsule, CapsuleMode::Talk);
        assert(talk.learnedCues && talk.learnedCues->size() == 6);

        capsule.learningEnabled = false;
        assert(!SnapshotExporter::project(capsule, CapsuleMode::Reflect).learnedCues.has_value());

        domain::capsule::Capsule blankOnly = domain::capsule::Capsule::Empty(t0);
        blankOnly.learnedTendencies.push_back(MakeTendency("  ", 1, t0));
        assert(!SnapshotExporter::project(blankOnly, CapsuleMode::Reflect).learnedCues.has_value());
        assert(!SnapshotExporter::project(domain::capsule::Capsule::Empty(t0), CapsuleMode::Talk).learnedCues.has_value());
        std::cout << "[PASS] Learned cue bounds" << std::endl;
    }

    // Fingerprint follows content.
    {
        domain::capsule::Capsule capsule = domain::capsule::Capsule::Empty(t0);
        auto a = SnapshotExporter::fingerprint(SnapshotExporter::project(capsule, CapsuleMode::Reflect));
        auto b = SnapshotExporter::fingerprint(SnapshotExporter::project(capsule, CapsuleMode::Reflect));
        capsule.preferences.outputStyle = "bullets";
        auto c = SnapshotExporter::fingerprint(SnapshotExporter::project(capsule, CapsuleMode::Reflect));
        assert(a == b);
        assert(a != c);
        std::cout << "[PASS] Snapshot fingerprint" << std::endl;
    }

    // Lane selection.
    {
        std::vector<RankedPattern> rows;
        const char* triggers[] = {"trigger:noise", "trigger:crowds", "trigger:bright_light", "trigger:interruptions",
                                  "trigger:being_observed", "trigger:group_dynamics", "trigger:hierarchy_games",
                                  "trigger:context_switching"};
        for (const char* key : triggers) rows.push_back(MakeRow(PatternKind::ConstraintTrigger, key, 1.0, 2, t0));
        rows.push_back(MakeRow(PatternKind::ConstraintTrigger, "trigger:eye_contact", 5.0, 9, t0));
        rows.push_back(MakeRow(PatternKind::ConstraintsSensitivity, "money_limit", 2.0, 1, t0));
        rows.push_back(MakeRow(PatternKind::StylePreference, "bullets", 0.2, 4, t0));
        rows.push_back(MakeRow(PatternKind::StylePreference, "concise", 0.9, 4, t0));
        rows.push_back(MakeRow(PatternKind::ReleasePattern, "release:settling", 0.9, 1, t0 - std::chrono::hours(24 * 10)));
        rows.push_back(MakeRow(PatternKind::ReleasePattern, "release:openness", 0.9, 1, t0));

        auto out = LearningSync::project(rows, std::nullopt, t0);
        int sticky = 0;
        bool sawConcise = false;
        bool sawOpenness = false;
        for (const auto& t : out) {
            assert(t.sourceKey != std::string("trigger:eye_contact"));
            assert(t.sourceKey != std::string("money_limit"));
            assert(t.sourceKey != std::string("bullets"));
            assert(t.sourceKey != std::string("release:settling"));
            if (t.sourceKind == std::string("constraint_trigger")) ++sticky;
            if (t.sourceKey == std::string("concise")) sawConcise = true;
            if (t.sourceKey == std::string("release:openness")) sawOpenness = true;
        }
        assert(sticky == 6);
        assert(sawConcise && sawOpenness);
        assert(out.back().sourceKey == std::string("release:openness"));
        assert(out.size() == 8);

        auto suppressed = LearningSync::project(rows, t0, t0);
        assert(suppressed.empty());
        std::cout << "[PASS] Lane selection" << std::endl;
    }

    // Service: store bounds, sync, gate and resets against real storage.
    {
        fs::path testRoot = fs::temp_directory_path() / "reflectcore_test_capsule";
        fs::remove_all(testRoot);
        fs::create_directories(testRoot);

        auto persistence = std::make_shared<infrastructure::PersistenceService>();
        auto statRepo = std::make_shared<infrastructure::PatternStatRepositoryFs>(testRoot.string(), persistence);
        auto capsuleRepo = std::make_shared<infrastructure::CapsuleRepositoryFs>(testRoot.string(), persistence);
        auto patterns = std::make_shared<PatternLearningService>(statRepo);

        domain::Timestamp clockNow = t0;
        CapsuleService service(capsuleRepo, patterns, [&clockNow]() { return clockNow; });

        auto initial = service.get();
        assert(initial.learningEnabled);
        assert(initial.version == 1);

        assert(service.setPreference("Output Style", " bullets "));
        assert(service.setPreference("No-Persona", "yes"));
        assert(!service.setPreference("no_therapy_framing", "maybe"));
        assert(!service.setPreference("bad key!", "x"));
        assert(service.setPreference("tone", "warm"));
        auto c = service.get();
        assert(c.preferences.outputStyle == std::string("bullets"));
        assert(c.preferences.noPersona == true);
        assert(!c.preferences.noTherapyFraming.has_value());
        assert(c.preferences.extras.at("tone") == "warm");
        assert(c.version == 4);

        assert(service.setPreference("tone", ""));
        assert(service.get().preferences.extras.count("tone") == 0);
        assert(service.removePreference("output_style"));
        assert(!service.removePreference("output_style"));

        for (int i = 0; i < 34; ++i) {
            assert(service.setPreference("k" + std::to_string(i), "v"));
        }
        assert(!service.setPreference("one_too_many", "v"));
        assert(service.setPreference("k0", "updated"));
        assert(service.get().preferences.extras.size() == 34);

        // List keys bypass the full extras map and are normalised.
        using domain::capsule::ListPreference;
        assert(service.setPreference("practice:practices", " zazen, Metta, ZAZEN, , metta "));
        assert((service.list(ListPreference::Practices) == std::vector<std::string>{"Metta", "zazen"}));
        assert(service.get().preferences.extras.count("practice:practices") == 0);

        assert(service.setPreference("Practice:Terms", R"(["b", "A", "b", 3])"));
        assert((service.list(ListPreference::Terms) == std::vector<std::string>{"A", "b"}));

        service.setList(ListPreference::Figures, {std::string("Zo\xC3\xAB"), std::string("ZO\xC3\x8B"), "  "});
        assert(service.list(ListPreference::Figures).size() == 1);
        assert(service.setPreference("practice:figures", ""));
        assert(service.list(ListPreference::Figures).empty());

        bool listed = false;
        for (const auto& [k, v] : service.preferenceKeyValues()) {
            if (k == "practice:practices") listed = v == "Metta, zazen";
        }
        assert(listed);
        auto exported = SnapshotExporter::project(service.get(), CapsuleMode::Reflect);
        assert(PreferenceValue(exported, "practice:practices") == std::string(R"(["Metta","zazen"])"));

        assert(service.removePreference("practice:terms"));
        assert(!service.removePreference("practice:terms"));

        domain::capsule::PreferenceEdits listEdits;
        listEdits.extras["practice:milestones"] = "first retreat, First Retreat";
        auto withMilestones = service.update(listEdits);
        assert((withMilestones.preferences.lists.at(ListPreference::Milestones) == std::vector<std::string>{"first retreat"}));
        assert(withMilestones.preferences.extras.count("practice:milestones") == 0);
        assert(withMilestones.preferences.extras.size() == 34);

        domain::capsule::PreferenceEdits edits;
        edits.optionsBeforeQuestions = std::optional<bool>(true);
        edits.noPersona = std::optional<bool>();
        edits.extras["k1"] = "";
        int versionBefore = service.get().version;
        auto edited = service.update(edits);
        assert(edited.version == versionBefore + 1);
        assert(edited.preferences.optionsBeforeQuestions == true);
        assert(!edited.preferences.noPersona.has_value());
        assert(edited.preferences.extras.count("k1") == 0);

        // Learned tendencies come from the pattern store.
        patterns->observe(PatternKind::ConstraintTrigger, "trigger:noise", 0.4, t0);
        patterns->observe(PatternKind::ConstraintTrigger, "trigger:noise", 0.4, t0);
        assert(service.syncLearnedTendencies(t0));
        assert(!service.syncLearnedTendencies(t0));
        auto synced = service.get();
        assert(synced.learnedTendencies.size() == 1);
        assert(synced.learnedTendencies[0].statement == "Often harder in noisy environments");
        assert(synced.learnedTendencies[0].evidenceCount == 2);

        auto withCues = SnapshotExporter::project(synced, CapsuleMode::Reflect);
        assert(withCues.learnedCues && withCues.learnedCues->size() == 1);

        // Disabling gates export only; re-enabling restores immediately.
        service.setLearningEnabled(false);
        assert(!patterns->isLearningEnabled());
        assert(!SnapshotExporter::project(service.get(), CapsuleMode::Reflect).learnedCues.has_value());
        assert(service.get().learnedTendencies.size() == 1);
        service.setLearningEnabled(true);
        assert(SnapshotExporter::project(service.get(), CapsuleMode::Reflect).learnedCues.has_value());

        // Reset clears learned state but keeps explicit preferences.
        clockNow = t0 + std::chrono::hours(1);
        service.resetLearnedProfile();
        auto reset = service.get();
        assert(reset.learnedTendencies.empty());
        assert(reset.learningResetAt == clockNow);
        assert(reset.preferences.optionsBeforeQuestions == true);
        assert(patterns->rankedPatterns(clockNow).empty());
        assert(!SnapshotExporter::project(reset, CapsuleMode::Reflect).learnedCues.has_value());

        // A row last seen before the reset stays hidden even if it reappears in the input.
        std::vector<RankedPattern> stale = {MakeRow(PatternKind::ConstraintTrigger, "trigger:noise", 1.0, 3, t0)};
        assert(!SnapshotExporter::project(reset, CapsuleMode::Reflect, stale, clockNow).learnedCues.has_value());

        // State survives a reload.
        CapsuleService reloaded(capsuleRepo, patterns);
        assert(reloaded.get().preferences.optionsBeforeQuestions == true);
        assert(reloaded.get().learningResetAt.has_value());
        assert((reloaded.list(ListPreference::Practices) == std::vector<std::string>{"Metta", "zazen"}));

        service.resetToDefaults();
        auto fresh = service.get();
        assert(fresh.preferences.extras.empty());
        assert(fresh.preferences.lists.empty());
        assert(fresh.learningEnabled);
        assert(!fresh.learningResetAt.has_value());

        fs::remove_all(testRoot);
        std::cout << "[PASS] Capsule service" << std::endl;
    }

    assert(CapsuleService::NormaliseKey("  Output -- Style ") == "output_style");
    assert(CapsuleService::ParseBool("Off") == false);
    assert(!CapsuleService::ParseBool("sometimes"));
    assert((CapsuleService::DecodeList("[not json") == std::vector<std::string>{"[not json"}));
    assert((CapsuleService::DecodeList("a,,b") == std::vector<std::string>{"a", "", "b"}));

    std::cout << "[Test] Capsule Snapshot Test PASSED" << std::endl;
    return 0;
}
