/**
 * @file JsonMapping.cpp
 * @brief Implementation of the JSON mapping helpers.
 */

#include "infrastructure/JsonMapping.hpp"
#include "domain/gateway/GatewayErrors.hpp"

namespace reflectcore::infrastructure {

using namespace reflectcore::domain;

namespace {

template <typename T>
void PutOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

void PutTime(json& j, const char* key, const std::optional<Timestamp>& value) {
    if (value) j[key] = ToEpochMillis(*value);
}

template <typename T>
std::optional<T> GetOptional(const json& j, const char* key) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return std::nullopt;
}

std::optional<Timestamp> GetTime(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) {
        return FromEpochMillis(j[key].get<long long>());
    }
    return std::nullopt;
}

Timestamp GetTimeOr(const json& j, const char* key, Timestamp fallback) {
    auto t = GetTime(j, key);
    return t ? *t : fallback;
}

json TurnErrorToJson(const turn::TurnError& e) {
    json j = {{"domain", e.domain}, {"code", e.code}};
    PutOptional(j, "userFacingKey", e.userFacingKey);
    PutOptional(j, "debugMessage", e.debugMessage);
    return j;
}

turn::TurnError TurnErrorFromJson(const json& j) {
    turn::TurnError e;
    e.domain = j.value("domain", "");
    e.code = j.value("code", 0);
    e.userFacingKey = GetOptional<std::string>(j, "userFacingKey");
    e.debugMessage = GetOptional<std::string>(j, "debugMessage");
    return e;
}

} // namespace

json TurnToJson(const turn::Turn& t) {
    json j;
    j["id"] = t.id;
    j["source"] = turn::SourceToString(t.source);
    j["recordedAt_ms"] = ToEpochMillis(t.recordedAt);
    PutTime(j, "endedAt_ms", t.endedAt);
    PutOptional(j, "durationSeconds", t.durationSeconds);
    PutTime(j, "sourceOriginalDate_ms", t.sourceOriginalDate);
    j["captureContext"] = turn::ContextToString(t.captureContext);
    j["title"] = t.title;
    PutOptional(j, "audioPath", t.audioPath);
    j["audioBytes"] = t.audioBytes;
    PutOptional(j, "transcriptRaw", t.transcriptRaw);
    j["transcriptRedactedActive"] = t.transcriptRedactedActive;

    json tools = json::object();
    for (const auto& [tool, out] : t.toolOutputs) {
        tools[turn::ToolToString(tool)] = {
            {"text", out.text},
            {"promptVersion", out.promptVersion},
            {"updatedAt_ms", ToEpochMillis(out.updatedAt)}
        };
    }
    j["toolOutputs"] = tools;

    json talk = json::array();
    for (const auto& msg : t.talkMessages) {
        talk.push_back({{"role", msg.role}, {"text", msg.text}, {"at_ms", ToEpochMillis(msg.at)}});
    }
    j["talkMessages"] = talk;
    PutOptional(j, "talkLastResponseId", t.talkLastResponseId);
    PutOptional(j, "talkPromptVersion", t.talkPromptVersion);
    PutTime(j, "talkUpdatedAt_ms", t.talkUpdatedAt);

    j["learningSnapshotJson"] = t.learningSnapshotJson;
    j["learningSnapshotVersion"] = t.learningSnapshotVersion;
    PutTime(j, "learningSnapshotUpdatedAt_ms", t.learningSnapshotUpdatedAt);

    j["redactionVersion"] = t.redactionVersion;
    PutTime(j, "redactionTimestamp_ms", t.redactionTimestamp);
    PutOptional(j, "redactionInputHash", t.redactionInputHash);

    j["state"] = turn::StateToString(t.state);

    j["transcriptionProvider"] = turn::TranscriptionProviderToString(t.transcriptionProvider);
    PutOptional(j, "transcriptionLocale", t.transcriptionLocale);
    j["reflectProvider"] = turn::ReflectProviderToString(t.reflectProvider);
    PutOptional(j, "promptVersion", t.promptVersion);
    PutOptional(j, "toolchainVersion", t.toolchainVersion);
    PutOptional(j, "capsuleSnapshotHash", t.capsuleSnapshotHash);

    PutTime(j, "processingStartedAt_ms", t.processingStartedAt);
    PutTime(j, "processingFinishedAt_ms", t.processingFinishedAt);

    if (t.error) {
        j["error"] = TurnErrorToJson(*t.error);
    }
    return j;
}

turn::Turn TurnFromJson(const json& j) {
    turn::Turn t;
    t.id = j.at("id").get<std::string>();
    t.source = turn::SourceFromString(j.value("source", "captured"));
    t.recordedAt = FromEpochMillis(j.value("recordedAt_ms", 0LL));
    t.endedAt = GetTime(j, "endedAt_ms");
    t.durationSeconds = GetOptional<double>(j, "durationSeconds");
    t.sourceOriginalDate = GetTime(j, "sourceOriginalDate_ms");
    t.captureContext = turn::ContextFromString(j.value("captureContext", "unknown"));
    t.title = j.value("title", "");
    t.audioPath = GetOptional<std::string>(j, "audioPath");
    t.audioBytes = j.value("audioBytes", static_cast<std::int64_t>(0));
    t.transcriptRaw = GetOptional<std::string>(j, "transcriptRaw");
    t.transcriptRedactedActive = j.value("transcriptRedactedActive", "");

    if (j.contains("toolOutputs") && j["toolOutputs"].is_object()) {
        for (const auto& [name, val] : j["toolOutputs"].items()) {
            auto tool = turn::ToolFromString(name);
            if (!tool) continue;
            turn::ToolOutput out;
            out.text = val.value("text", "");
            out.promptVersion = val.value("promptVersion", "");
            out.updatedAt = FromEpochMillis(val.value("updatedAt_ms", 0LL));
            t.toolOutputs[*tool] = out;
        }
    }

    if (j.contains("talkMessages") && j["talkMessages"].is_array()) {
        for (const auto& m : j["talkMessages"]) {
            t.talkMessages.push_back({m.value("role", ""), m.value("text", ""),
                                      FromEpochMillis(m.value("at_ms", 0LL))});
        }
    }
    t.talkLastResponseId = GetOptional<std::string>(j, "talkLastResponseId");
    t.talkPromptVersion = GetOptional<std::string>(j, "talkPromptVersion");
    t.talkUpdatedAt = GetTime(j, "talkUpdatedAt_ms");

    t.learningSnapshotJson = j.value("learningSnapshotJson", std::string(turn::kEmptyLearningSnapshot));
    t.learningSnapshotVersion = j.value("learningSnapshotVersion", 1);
    t.learningSnapshotUpdatedAt = GetTime(j, "learningSnapshotUpdatedAt_ms");

    t.redactionVersion = j.value("redactionVersion", 1);
    t.redactionTimestamp = GetTime(j, "redactionTimestamp_ms");
    t.redactionInputHash = GetOptional<std::string>(j, "redactionInputHash");

    t.state = turn::StateFromString(j.value("state", ""));

    t.transcriptionProvider = turn::TranscriptionProviderFromString(j.value("transcriptionProvider", "unknown"));
    t.transcriptionLocale = GetOptional<std::string>(j, "transcriptionLocale");
    t.reflectProvider = turn::ReflectProviderFromString(j.value("reflectProvider", "none"));
    t.promptVersion = GetOptional<std::string>(j, "promptVersion");
    t.toolchainVersion = GetOptional<std::string>(j, "toolchainVersion");
    t.capsuleSnapshotHash = GetOptional<std::string>(j, "capsuleSnapshotHash");

    t.processingStartedAt = GetTime(j, "processingStartedAt_ms");
    t.processingFinishedAt = GetTime(j, "processingFinishedAt_ms");

    if (j.contains("error") && j["error"].is_object()) {
        t.error = TurnErrorFromJson(j["error"]);
    }
    return t;
}

json RedactionRecordToJson(const turn::RedactionRecord& r) {
    return {
        {"id", r.id},
        {"turnId", r.turnId},
        {"version", r.version},
        {"ts", ToEpochMillis(r.timestamp)},
        {"inputHash", r.inputHash},
        {"textRedacted", r.textRedacted}
    };
}

turn::RedactionRecord RedactionRecordFromJson(const json& j) {
    turn::RedactionRecord r;
    r.id = j.value("id", "");
    r.turnId = j.value("turnId", "");
    r.version = j.value("version", 1);
    r.timestamp = FromEpochMillis(j.value("ts", 0LL));
    r.inputHash = j.value("inputHash", "");
    r.textRedacted = j.value("textRedacted", "");
    return r;
}

json PatternStatToJson(const learning::PatternStat& s) {
    return {
        {"kind", learning::KindToString(s.kind)},
        {"key", s.key},
        {"score", s.score},
        {"count", s.count},
        {"firstSeenAt_ms", ToEpochMillis(s.firstSeenAt)},
        {"lastSeenAt_ms", ToEpochMillis(s.lastSeenAt)},
        {"halfLifeDays", s.halfLifeDays}
    };
}

std::optional<learning::PatternStat> PatternStatFromJson(const json& j) {
    auto kind = learning::KindFromString(j.value("kind", ""));
    if (!kind) return std::nullopt;

    learning::PatternStat s;
    s.kind = *kind;
    s.key = j.value("key", "");
    s.score = j.value("score", 0.0);
    s.count = j.value("count", 0);
    s.firstSeenAt = FromEpochMillis(j.value("firstSeenAt_ms", 0LL));
    s.lastSeenAt = FromEpochMillis(j.value("lastSeenAt_ms", 0LL));
    s.halfLifeDays = j.value("halfLifeDays", learning::kDefaultHalfLifeDays);
    return s;
}

json CapsuleToJson(const capsule::Capsule& c) {
    json prefs;
    PutOptional(prefs, "outputStyle", c.preferences.outputStyle);
    PutOptional(prefs, "optionsBeforeQuestions", c.preferences.optionsBeforeQuestions);
    PutOptional(prefs, "noTherapyFraming", c.preferences.noTherapyFraming);
    PutOptional(prefs, "noPersona", c.preferences.noPersona);
    PutOptional(prefs, "pseudonym", c.preferences.pseudonym);
    json lists = json::object();
    for (const auto& [list, values] : c.preferences.lists) {
        lists[capsule::ListPreferenceKey(list)] = values;
    }
    prefs["lists"] = lists;
    prefs["extras"] = c.preferences.extras;

    json tendencies = json::array();
    for (const auto& t : c.learnedTendencies) {
        json tj = {
            {"statement", t.statement},
            {"evidenceCount", t.evidenceCount},
            {"firstSeenAt_ms", ToEpochMillis(t.firstSeenAt)},
            {"lastSeenAt_ms", ToEpochMillis(t.lastSeenAt)},
            {"isOverridden", t.isOverridden}
        };
        PutOptional(tj, "sourceKind", t.sourceKind);
        PutOptional(tj, "sourceKey", t.sourceKey);
        tendencies.push_back(tj);
    }

    json j = {
        {"version", c.version},
        {"learningEnabled", c.learningEnabled},
        {"updatedAt_ms", ToEpochMillis(c.updatedAt)},
        {"preferences", prefs},
        {"learnedTendencies", tendencies}
    };
    PutTime(j, "learningResetAt_ms", c.learningResetAt);
    return j;
}

capsule::Capsule CapsuleFromJson(const json& j) {
    capsule::Capsule c;
    c.version = j.value("version", 1);
    c.learningEnabled = j.value("learningEnabled", true);
    c.updatedAt = GetTimeOr(j, "updatedAt_ms", std::chrono::system_clock::now());
    c.learningResetAt = GetTime(j, "learningResetAt_ms");

    if (j.contains("preferences") && j["preferences"].is_object()) {
        const auto& p = j["preferences"];
        c.preferences.outputStyle = GetOptional<std::string>(p, "outputStyle");
        c.preferences.optionsBeforeQuestions = GetOptional<bool>(p, "optionsBeforeQuestions");
        c.preferences.noTherapyFraming = GetOptional<bool>(p, "noTherapyFraming");
        c.preferences.noPersona = GetOptional<bool>(p, "noPersona");
        c.preferences.pseudonym = GetOptional<std::string>(p, "pseudonym");
        if (p.contains("lists") && p["lists"].is_object()) {
            for (const auto& item : p["lists"].items()) {
                auto list = capsule::ListPreferenceFromKey(item.key());
                if (!list || !item.value().is_array()) continue;
                std::vector<std::string> values;
                for (const auto& v : item.value()) {
                    if (v.is_string()) values.push_back(v.get<std::string>());
                }
                if (!values.empty()) c.preferences.lists[*list] = std::move(values);
            }
        }
        if (p.contains("extras") && p["extras"].is_object()) {
            for (const auto& [k, v] : p["extras"].items()) {
                if (v.is_string()) c.preferences.extras[k] = v.get<std::string>();
            }
        }
    }

    if (j.contains("learnedTendencies") && j["learnedTendencies"].is_array()) {
        for (const auto& tj : j["learnedTendencies"]) {
            capsule::CapsuleTendency t;
            t.statement = tj.value("statement", "");
            t.evidenceCount = tj.value("evidenceCount", 1);
            t.firstSeenAt = FromEpochMillis(tj.value("firstSeenAt_ms", 0LL));
            t.lastSeenAt = FromEpochMillis(tj.value("lastSeenAt_ms", 0LL));
            t.isOverridden = tj.value("isOverridden", false);
            t.sourceKind = GetOptional<std::string>(tj, "sourceKind");
            t.sourceKey = GetOptional<std::string>(tj, "sourceKey");
            c.learnedTendencies.push_back(t);
        }
    }
    return c;
}

json DictionaryToJson(const redaction::RedactionDictionary& dict) {
    return {{"version", dict.version}, {"tokens", dict.tokens}};
}

redaction::RedactionDictionary DictionaryFromJson(const json& j) {
    redaction::RedactionDictionary dict;
    dict.version = j.value("version", 1);
    if (j.contains("tokens") && j["tokens"].is_array()) {
        for (const auto& t : j["tokens"]) {
            if (t.is_string()) dict.tokens.push_back(t.get<std::string>());
        }
    }
    return dict;
}

json SnapshotToWireJson(const capsule::ExportSnapshot& s) {
    json prefs = json::object();
    for (const auto& [k, v] : s.preferences) {
        prefs[k] = v;
    }
    json j = {
        {"version", s.version},
        {"updatedAt", s.updatedAtISO},
        {"preferences", prefs}
    };
    if (s.learnedCues) {
        json cues = json::array();
        for (const auto& cue : *s.learnedCues) {
            json cj = {
                {"statement", cue.statement},
                {"evidenceCount", cue.evidenceCount},
                {"lastSeenAtISO", cue.lastSeenAtISO}
            };
            PutOptional(cj, "kindRaw", cue.kindRaw);
            PutOptional(cj, "key", cue.key);
            cues.push_back(cj);
        }
        j["learnedCues"] = cues;
    }
    return j;
}

json ReflectRequestToWireJson(const gateway::ReflectRequest& r) {
    json j = {{"text", r.text}, {"client", r.client}, {"appVersion", r.appVersion}};
    PutOptional(j, "recordedAt", r.recordedAtISO);
    if (r.capsule) j["capsule"] = SnapshotToWireJson(*r.capsule);
    return j;
}

json TalkRequestToWireJson(const gateway::TalkRequest& r) {
    json j = {{"text", r.text}, {"client", r.client}, {"appVersion", r.appVersion}};
    PutOptional(j, "recordedAt", r.recordedAtISO);
    PutOptional(j, "previous_response_id", r.previousResponseId);
    if (r.capsule) j["capsule"] = SnapshotToWireJson(*r.capsule);
    return j;
}

gateway::ReflectResponse ReflectResponseFromWireJson(const json& j) {
    if (!j.is_object() || !j.contains("text") || !j["text"].is_string() ||
        !j.contains("prompt_version") || !j["prompt_version"].is_string()) {
        throw gateway::GatewayDecodeError("expected {text, prompt_version}");
    }
    return {j["text"].get<std::string>(), j["prompt_version"].get<std::string>()};
}

gateway::TalkResponse TalkResponseFromWireJson(const json& j) {
    if (!j.is_object() || !j.contains("text") || !j["text"].is_string() ||
        !j.contains("response_id") || !j["response_id"].is_string() ||
        !j.contains("prompt_version") || !j["prompt_version"].is_string()) {
        throw gateway::GatewayDecodeError("expected {text, response_id, prompt_version}");
    }
    return {j["text"].get<std::string>(), j["response_id"].get<std::string>(),
            j["prompt_version"].get<std::string>()};
}

gateway::StepsResponse StepsResponseFromWireJson(const json& j) {
    try {
        gateway::StepsResponse r;
        r.programmeSlug = j.at("programmeSlug").get<std::string>();
        r.count = j.at("count").get<int>();
        r.maxVersion = j.at("maxVersion").get<int>();
        for (const auto& sj : j.at("steps")) {
            gateway::TeachingStep step;
            step.stepIndex = sj.at("stepIndex").get<int>();
            step.title = sj.at("title").get<std::string>();
            step.body = sj.at("body").get<std::string>();
            if (sj.contains("tags") && sj["tags"].is_array()) {
                step.tags = sj["tags"].get<std::vector<std::string>>();
            }
            step.version = GetOptional<int>(sj, "version");
            r.steps.push_back(step);
        }
        return r;
    } catch (const json::exception& e) {
        throw gateway::GatewayDecodeError(e.what());
    }
}

} // namespace reflectcore::infrastructure
