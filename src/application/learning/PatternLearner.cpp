/**
 * @file PatternLearner.cpp
 * @brief Implementation of PatternLearner.
 */

#include "application/learning/PatternLearner.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <utility>
#include <nlohmann/json.hpp>

namespace reflectcore::application::learning {

using json = nlohmann::json;

namespace {

using PhraseList = std::vector<std::string>;

constexpr std::size_t kMaxSituationalPerTurn = 6;
constexpr std::size_t kMaxProfilePerTurn = 6;

bool ContainsAny(const std::string& text, const PhraseList& phrases) {
    return std::any_of(phrases.begin(), phrases.end(),
                       [&](const std::string& p) { return text.find(p) != std::string::npos; });
}

std::string Lowercase(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

const PhraseList kNoisePhrases = {"noise", "noisy", "too loud", "loud noise", "loud noises", "background noise"};
const PhraseList kBrightLightPhrases = {"bright light", "bright lights", "glare", "fluorescent light", "fluorescent lights"};
const PhraseList kCrowdPhrases = {"crowds", "crowded", "crowded places", "busy places", "too many people"};
const PhraseList kHierarchyPhrases = {"hierarchy games", "power games", "status games", "power dynamics"};
const PhraseList kObservedPhrases = {"being watched", "being observed", "people watching me"};

// Ordered so the per-turn cap drops the same items every time.
const std::vector<std::pair<std::string, PhraseList>>& SituationalTriggers() {
    static const std::vector<std::pair<std::string, PhraseList>> triggers = {
        {"trigger:noise", kNoisePhrases},
        {"trigger:bright_light", kBrightLightPhrases},
        {"trigger:crowds", kCrowdPhrases},
        {"trigger:group_dynamics", {"group dynamics"}},
        {"trigger:hierarchy_games", kHierarchyPhrases},
        {"trigger:being_observed", kObservedPhrases},
        {"trigger:too_many_variables", {"too many variables", "too many moving parts", "too many factors"}},
        {"trigger:unclear_requirements", {"unclear requirements", "requirements unclear", "not clear what is needed"}},
        {"trigger:interruptions", {"interruptions", "interrupted", "getting interrupted"}},
        {"trigger:context_switching", {"context switching", "switching context", "switching tasks", "task switching"}},
        {"trigger:deadline_pressure", {"deadline pressure", "tight deadline", "deadline looming"}},
        {"trigger:low_sleep", {"low sleep", "no sleep", "little sleep", "sleep deprived", "didn't sleep", "did not sleep"}},
        {"trigger:low_energy", {"low energy", "exhausted", "tired", "burnt out", "burned out"}}
    };
    return triggers;
}

std::string AgeBand(int age) {
    if (age < 18) return "under_18";
    if (age < 25) return "18_24";
    if (age < 35) return "25_34";
    if (age < 45) return "35_44";
    if (age < 55) return "45_54";
    if (age < 65) return "55_64";
    if (age < 75) return "65_74";
    return "75_plus";
}

} // namespace

std::vector<PatternObservation> PatternLearner::derive(const std::string& redactedText) const {
    std::string text = Lowercase(redactedText);
    if (text.find_first_not_of(" \t\n\r") == std::string::npos) return {};

    std::vector<PatternObservation> all;
    auto append = [&all](std::vector<PatternObservation> part) {
        all.insert(all.end(), part.begin(), part.end());
    };
    append(deriveRelease(text));
    append(deriveSituationalConstraints(text));
    append(deriveQuestionAndBreadth(text));
    append(deriveProfileSignals(text));
    append(deriveDeactivations(text));

    // Dedupe per (kind, key), keeping the strongest. An explicit deactivation beats any
    // reinforcement of the same key in the same text.
    std::map<std::string, PatternObservation> unique;
    for (const auto& o : all) {
        std::string k = domain::learning::KindToString(o.kind) + "|" + o.key;
        auto it = unique.find(k);
        if (it == unique.end()) {
            unique.emplace(k, o);
            continue;
        }
        bool existingNegative = it->second.strength < 0.0;
        bool incomingNegative = o.strength < 0.0;
        if (incomingNegative != existingNegative) {
            if (incomingNegative) it->second = o;
        } else if (o.strength > it->second.strength) {
            it->second = o;
        }
    }

    std::vector<PatternObservation> out;
    for (auto& [_, o] : unique) out.push_back(o);
    std::sort(out.begin(), out.end(), [](const PatternObservation& a, const PatternObservation& b) {
        if (a.strength != b.strength) return a.strength > b.strength;
        return a.key < b.key;
    });
    if (out.size() > kMaxObservationsPerTurn) out.resize(kMaxObservationsPerTurn);
    return out;
}

std::vector<PatternObservation> PatternLearner::deriveRelease(const std::string& text) const {
    static const PhraseList ease = {
        "ease", "easier", "with ease", "can breathe", "could breathe", "breathing easier", "relief", "relieved"
    };
    static const PhraseList settling = {
        "settled", "settling", "less tight", "less tense", "unclench", "soften", "softening"
    };
    static const PhraseList openness = {
        "more space", "there is space", "space opened", "spacious", "feel space", "sense of space",
        "let go", "dropped it", "drop it"
    };

    std::vector<PatternObservation> out;
    if (ContainsAny(text, ease)) out.push_back({PatternKind::ReleasePattern, "release:ease_present", 0.4});
    if (ContainsAny(text, settling)) out.push_back({PatternKind::ReleasePattern, "release:settling", 0.4});
    if (ContainsAny(text, openness)) out.push_back({PatternKind::ReleasePattern, "release:openness", 0.3});
    return out;
}

std::vector<PatternObservation> PatternLearner::deriveSituationalConstraints(const std::string& text) const {
    std::vector<PatternObservation> out;
    for (const auto& [key, phrases] : SituationalTriggers()) {
        if (ContainsAny(text, phrases)) {
            out.push_back({PatternKind::ConstraintTrigger, key, 0.4});
            if (out.size() == kMaxSituationalPerTurn) break;
        }
    }
    return out;
}

std::vector<PatternObservation> PatternLearner::deriveQuestionAndBreadth(const std::string& text) const {
    static const PhraseList questionLight = {
        "stop asking questions", "just tell me", "don't ask me questions", "do not ask me questions",
        "no questions", "no more questions", "quit asking questions", "stop with the questions"
    };
    static const PhraseList questionGuided = {
        "ask me questions", "help me think this through", "question me", "can you question me",
        "guide me with questions", "ask questions to help me think"
    };
    static const PhraseList narrow = {
        "one thing at a time", "just pick one", "too many options", "pick one for me", "choose one for me",
        "don't give me options", "do not give me options", "just choose for me", "pick one"
    };
    static const PhraseList explore = {
        "what are my options", "map it out", "what else could work", "alternatives", "explore options",
        "show me options", "option space", "lay out the options"
    };

    std::vector<PatternObservation> out;
    if (ContainsAny(text, questionLight)) out.push_back({PatternKind::WorkflowPreference, "question_light", 0.5});
    if (ContainsAny(text, questionGuided)) out.push_back({PatternKind::WorkflowPreference, "question_guided", 0.5});
    if (ContainsAny(text, narrow)) out.push_back({PatternKind::WorkflowPreference, "narrow_first", 0.5});
    if (ContainsAny(text, explore)) out.push_back({PatternKind::WorkflowPreference, "explore_space", 0.5});
    return out;
}

std::vector<PatternObservation> PatternLearner::deriveProfileSignals(const std::string& text) const {
    std::vector<PatternObservation> out;
    auto add = [&out](const std::string& key, double strength) {
        out.push_back({PatternKind::TopicRecurrence, key, strength});
    };

    if (ContainsAny(text, {"english only", "only english", "i only speak english", "i just speak english",
                           "i speak english", "english is my first language"})) {
        add("profile:language:english", 0.25);
    }
    if (ContainsAny(text, {"english isn't my first language", "english is not my first language",
                           "non-native english", "non native english"})) {
        add("profile:language:non_native_english", 0.25);
    }

    // Region requires a first-person anchor.
    if (ContainsAny(text, {"i'm in europe", "i am in europe", "im in europe", "i live in europe",
                           "i'm based in europe", "i am based in europe", "i'm from europe", "i am from europe"})) {
        add("profile:region:europe", 0.20);
    }

    // Age: explicit numeric statements only; stored as band and decade, never the exact value.
    static const std::vector<std::regex> agePatterns = {
        std::regex(R"(\bi[' ]?m\s+(\d{1,2})\b)"),
        std::regex(R"(\bi\s+am\s+(\d{1,2})\b)"),
        std::regex(R"(\b(\d{1,2})\s+years\s+old)"),
        std::regex(R"(\baged\s+(\d{1,2})\b)")
    };
    for (const auto& re : agePatterns) {
        std::smatch m;
        if (std::regex_search(text, m, re) && m.size() >= 2) {
            int age = std::stoi(m.str(1));
            if (age >= 18 && age <= 99) {
                add("profile:age_band:" + AgeBand(age), 0.25);
                add("profile:age_decade:" + std::to_string((age / 10) * 10) + "s", 0.20);
                break;
            }
        }
    }

    if (out.size() > kMaxProfilePerTurn) out.resize(kMaxProfilePerTurn);
    return out;
}

std::vector<PatternObservation> PatternLearner::deriveDeactivations(const std::string& text) const {
    static const PhraseList markers = {
        "not anymore", "no longer", "it's fine now", "it is fine now", "stop doing that", "don't do that",
        "do not do that", "you can stop", "i don't need that", "i do not need that"
    };
    if (!ContainsAny(text, markers)) return {};

    struct Sticky {
        PatternKind kind;
        const char* key;
        const PhraseList* phrases;
    };
    static const PhraseList stopQuestions = {"stop asking questions", "no questions", "stop with the questions"};
    static const std::vector<Sticky> sticky = {
        {PatternKind::ConstraintTrigger, "trigger:noise", &kNoisePhrases},
        {PatternKind::ConstraintTrigger, "trigger:bright_light", &kBrightLightPhrases},
        {PatternKind::ConstraintTrigger, "trigger:crowds", &kCrowdPhrases},
        {PatternKind::ConstraintTrigger, "trigger:hierarchy_games", &kHierarchyPhrases},
        {PatternKind::ConstraintTrigger, "trigger:being_observed", &kObservedPhrases},
        {PatternKind::ConstraintsSensitivity, "sensory_noise", &kNoisePhrases},
        {PatternKind::WorkflowPreference, "question_light", &stopQuestions}
    };

    std::vector<PatternObservation> out;
    for (const auto& s : sticky) {
        if (ContainsAny(text, *s.phrases)) {
            out.push_back({s.kind, s.key, -0.6});
        }
    }
    return out;
}

std::string PatternLearner::ToSnapshotJson(const std::vector<PatternObservation>& observations) {
    if (observations.empty()) return "{}";
    json items = json::array();
    for (const auto& o : observations) {
        items.push_back({{"kind", domain::learning::KindToString(o.kind)}, {"key", o.key}, {"strength", o.strength}});
    }
    return json{{"observations", items}}.dump();
}

} // namespace reflectcore::application::learning
