/**
 * @file CapsuleService.cpp
 * @brief Implementation of CapsuleService.
 */

#include "application/capsule/CapsuleService.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>
#include <set>
#include <nlohmann/json.hpp>
#include "application/capsule/LearningSync.hpp"
#include "domain/CaseFolding.hpp"
#include "domain/TextUtils.hpp"

namespace reflectcore::application::capsule {

using domain::Trim;
using domain::TruncateUtf8;
using domain::capsule::ListPreferenceFromKey;
using domain::capsule::ListPreferenceKey;
using json = nlohmann::json;

namespace {

const char* kOutputStyleKey = "output_style";
const char* kOptionsBeforeQuestionsKey = "options_before_questions";
const char* kNoTherapyFramingKey = "no_therapy_framing";
const char* kNoPersonaKey = "no_persona";
const char* kPseudonymKey = "pseudonym";

std::optional<std::string> BoundedText(const std::string& raw, std::size_t maxChars) {
    std::string v = Trim(raw);
    if (v.empty()) return std::nullopt;
    return TruncateUtf8(v, maxChars);
}

std::string BoolText(bool v) {
    return v ? "true" : "false";
}

std::string JoinList(const std::vector<std::string>& values) {
    std::string out;
    for (const auto& v : values) {
        if (!out.empty()) out += ", ";
        out += v;
    }
    return out;
}

} // namespace

CapsuleService::CapsuleService(std::shared_ptr<domain::capsule::CapsuleRepository> repository,
                               std::shared_ptr<learning::PatternLearningService> patterns,
                               Clock clock)
    : m_repository(std::move(repository)),
      m_patterns(std::move(patterns)),
      m_clock(std::move(clock)) {}

Timestamp CapsuleService::now() const {
    return m_clock ? m_clock() : std::chrono::system_clock::now();
}

Capsule& CapsuleService::loaded() {
    if (!m_capsule) {
        auto stored = m_repository->load();
        if (stored) {
            m_capsule = std::move(*stored);
        } else {
            std::cout << "[CapsuleService] Creating capsule" << std::endl;
            m_capsule = Capsule::Empty(now());
            m_repository->save(*m_capsule);
        }
        if (m_patterns) m_patterns->setLearningEnabled(m_capsule->learningEnabled);
    }
    return *m_capsule;
}

Capsule CapsuleService::get() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return loaded();
}

void CapsuleService::setLearningEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Capsule next = loaded();
    if (next.learningEnabled != enabled) {
        next.learningEnabled = enabled;
        next.updatedAt = now();
        m_repository->save(next);
        m_capsule = next;
        std::cout << "[CapsuleService] Learning " << (enabled ? "enabled" : "disabled") << std::endl;
    }
    if (m_patterns) m_patterns->setLearningEnabled(enabled);
}

Capsule CapsuleService::update(const PreferenceEdits& edits) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Capsule next = loaded();
    auto& prefs = next.preferences;

    if (edits.outputStyle) {
        prefs.outputStyle = *edits.outputStyle ? BoundedText(**edits.outputStyle, kOutputStyleMax) : std::nullopt;
    }
    if (edits.optionsBeforeQuestions) prefs.optionsBeforeQuestions = *edits.optionsBeforeQuestions;
    if (edits.noTherapyFraming) prefs.noTherapyFraming = *edits.noTherapyFraming;
    if (edits.noPersona) prefs.noPersona = *edits.noPersona;
    if (edits.pseudonym) {
        prefs.pseudonym = *edits.pseudonym ? BoundedText(**edits.pseudonym, kExtrasValueMax) : std::nullopt;
    }

    for (const auto& [list, values] : edits.lists) {
        applyList(next, list, values);
    }

    for (const auto& [rawKey, value] : edits.extras) {
        std::string key = NormaliseKey(rawKey);
        if (auto list = ListPreferenceFromKey(key)) {
            applyList(next, *list, DecodeList(value));
            continue;
        }
        if (!applyExtra(next, key, value)) {
            std::cerr << "[CapsuleService] Rejected preference extra '" << rawKey << "'" << std::endl;
        }
    }

    next.version += 1;
    next.updatedAt = now();
    m_repository->save(next);
    m_capsule = next;
    return next;
}

bool CapsuleService::setPreference(const std::string& rawKey, const std::string& value) {
    std::string key = NormaliseKey(rawKey);
    if (key.empty()) return false;

    std::lock_guard<std::mutex> lock(m_mutex);
    Capsule next = loaded();
    auto& prefs = next.preferences;
    std::string trimmed = Trim(value);

    auto setBool = [&](std::optional<bool>& field) {
        if (trimmed.empty()) {
            field.reset();
            return true;
        }
        auto parsed = ParseBool(trimmed);
        if (!parsed) return false;
        field = parsed;
        return true;
    };

    bool accepted = true;
    if (auto list = ListPreferenceFromKey(key)) {
        applyList(next, *list, DecodeList(trimmed));
    } else if (key == kOutputStyleKey) {
        prefs.outputStyle = BoundedText(trimmed, kOutputStyleMax);
    } else if (key == kOptionsBeforeQuestionsKey) {
        accepted = setBool(prefs.optionsBeforeQuestions);
    } else if (key == kNoTherapyFramingKey) {
        accepted = setBool(prefs.noTherapyFraming);
    } else if (key == kNoPersonaKey) {
        accepted = setBool(prefs.noPersona);
    } else if (key == kPseudonymKey) {
        prefs.pseudonym = BoundedText(trimmed, kExtrasValueMax);
    } else {
        accepted = applyExtra(next, key, trimmed);
    }

    if (!accepted) {
        std::cerr << "[CapsuleService] Rejected preference '" << key << "'" << std::endl;
        return false;
    }

    next.version += 1;
    next.updatedAt = now();
    m_repository->save(next);
    m_capsule = next;
    return true;
}

bool CapsuleService::removePreference(const std::string& rawKey) {
    std::string key = NormaliseKey(rawKey);
    if (key.empty()) return false;

    std::lock_guard<std::mutex> lock(m_mutex);
    Capsule next = loaded();
    auto& prefs = next.preferences;

    bool removed = false;
    auto clear = [&removed](auto& field) {
        removed = field.has_value();
        field.reset();
    };
    auto list = ListPreferenceFromKey(key);
    if (list) {
        bool hadList = prefs.lists.erase(*list) > 0;
        bool hadExtra = prefs.extras.erase(key) > 0;
        removed = hadList || hadExtra;
    } else if (key == kOutputStyleKey) {
        clear(prefs.outputStyle);
    } else if (key == kOptionsBeforeQuestionsKey) {
        clear(prefs.optionsBeforeQuestions);
    } else if (key == kNoTherapyFramingKey) {
        clear(prefs.noTherapyFraming);
    } else if (key == kNoPersonaKey) {
        clear(prefs.noPersona);
    } else if (key == kPseudonymKey) {
        clear(prefs.pseudonym);
    } else {
        removed = prefs.extras.erase(key) > 0;
    }

    if (!removed) return false;

    next.version += 1;
    next.updatedAt = now();
    m_repository->save(next);
    m_capsule = next;
    return true;
}

std::vector<std::pair<std::string, std::string>> CapsuleService::preferenceKeyValues() {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto& prefs = loaded().preferences;

    std::vector<std::pair<std::string, std::string>> out;
    if (prefs.outputStyle) out.emplace_back(kOutputStyleKey, *prefs.outputStyle);
    if (prefs.optionsBeforeQuestions) out.emplace_back(kOptionsBeforeQuestionsKey, BoolText(*prefs.optionsBeforeQuestions));
    if (prefs.noTherapyFraming) out.emplace_back(kNoTherapyFramingKey, BoolText(*prefs.noTherapyFraming));
    if (prefs.noPersona) out.emplace_back(kNoPersonaKey, BoolText(*prefs.noPersona));
    for (const auto& [list, values] : prefs.lists) out.emplace_back(ListPreferenceKey(list), JoinList(values));
    for (const auto& [k, v] : prefs.extras) out.emplace_back(k, v);
    return out;
}

void CapsuleService::setList(ListPreference list, const std::vector<std::string>& values) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Capsule next = loaded();
    applyList(next, list, values);
    next.version += 1;
    next.updatedAt = now();
    m_repository->save(next);
    m_capsule = next;
}

std::vector<std::string> CapsuleService::list(ListPreference which) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto& lists = loaded().preferences.lists;
    auto it = lists.find(which);
    return it == lists.end() ? std::vector<std::string>{} : it->second;
}

void CapsuleService::resetLearnedProfile() {
    std::lock_guard<std::mutex> lock(m_mutex);
    Capsule next = loaded();
    Timestamp ts = now();
    next.learnedTendencies.clear();
    next.learningResetAt = ts;
    next.updatedAt = ts;
    m_repository->save(next);
    m_capsule = next;

    if (m_patterns) m_patterns->reset();
    std::cout << "[CapsuleService] Learned profile cleared" << std::endl;
}

void CapsuleService::resetToDefaults() {
    std::lock_guard<std::mutex> lock(m_mutex);
    Capsule fresh = Capsule::Empty(now());
    m_repository->save(fresh);
    m_capsule = fresh;

    if (m_patterns) {
        m_patterns->reset();
        m_patterns->setLearningEnabled(fresh.learningEnabled);
    }
    std::cout << "[CapsuleService] Capsule reset to defaults" << std::endl;
}

bool CapsuleService::syncLearnedTendencies(Timestamp at) {
    if (!m_patterns) return false;

    std::lock_guard<std::mutex> lock(m_mutex);
    Capsule next = loaded();
    auto projected = LearningSync::project(m_patterns->rankedPatterns(at), next.learningResetAt, at);
    if (LearningSync::equivalent(next.learnedTendencies, projected)) return false;

    next.learnedTendencies = std::move(projected);
    next.updatedAt = at;
    m_repository->save(next);
    m_capsule = next;
    std::cout << "[CapsuleService] Learned tendencies updated (" << next.learnedTendencies.size() << ")" << std::endl;
    return true;
}

bool CapsuleService::applyExtra(Capsule& capsule, const std::string& key, const std::string& value) {
    if (key.empty() || key.size() > kExtrasKeyMax || !IsAllowedExtraKey(key)) return false;

    auto& extras = capsule.preferences.extras;
    std::string v = Trim(value);
    if (v.empty()) {
        extras.erase(key);
        return true;
    }
    v = TruncateUtf8(v, kExtrasValueMax);

    if (extras.find(key) == extras.end() && extras.size() >= kExtrasMaxItems) return false;
    extras[key] = v;
    return true;
}

void CapsuleService::applyList(Capsule& capsule, ListPreference list, const std::vector<std::string>& values) {
    auto& prefs = capsule.preferences;
    prefs.extras.erase(ListPreferenceKey(list));

    std::vector<std::string> normalised = NormaliseList(values);
    if (normalised.empty()) {
        prefs.lists.erase(list);
    } else {
        prefs.lists[list] = std::move(normalised);
    }
}

std::vector<std::string> CapsuleService::NormaliseList(const std::vector<std::string>& values) {
    std::vector<std::pair<std::string, std::string>> keyed;  // (folded, original)
    std::set<std::string> seen;
    for (const auto& raw : values) {
        std::string v = TruncateUtf8(Trim(raw), kExtrasValueMax);
        if (v.empty()) continue;
        std::string folded = domain::FoldCase(v);
        if (!seen.insert(folded).second) continue;
        keyed.emplace_back(std::move(folded), std::move(v));
    }
    std::sort(keyed.begin(), keyed.end());
    if (keyed.size() > kListMaxItems) keyed.resize(kListMaxItems);

    std::vector<std::string> out;
    out.reserve(keyed.size());
    for (auto& entry : keyed) out.push_back(std::move(entry.second));
    return out;
}

std::vector<std::string> CapsuleService::DecodeList(const std::string& raw) {
    std::string trimmed = Trim(raw);
    std::vector<std::string> out;
    if (trimmed.empty()) return out;

    if (trimmed.front() == '[') {
        json parsed = json::parse(trimmed, nullptr, false);
        if (parsed.is_array()) {
            for (const auto& item : parsed) {
                if (item.is_string()) out.push_back(item.get<std::string>());
            }
            return out;
        }
    }

    std::size_t start = 0;
    while (start <= trimmed.size()) {
        std::size_t comma = trimmed.find(',', start);
        if (comma == std::string::npos) comma = trimmed.size();
        out.push_back(trimmed.substr(start, comma - start));
        start = comma + 1;
    }
    return out;
}

std::string CapsuleService::NormaliseKey(const std::string& raw) {
    std::string lowered = domain::ToLowerAscii(Trim(raw));

    std::string out;
    out.reserve(lowered.size());
    for (char c : lowered) {
        bool separator = c == '-' || c == '_' || std::isspace(static_cast<unsigned char>(c));
        if (separator) {
            if (!out.empty() && out.back() != '_') out.push_back('_');
        } else {
            out.push_back(c);
        }
    }
    while (!out.empty() && out.back() == '_') out.pop_back();
    return out;
}

std::optional<bool> CapsuleService::ParseBool(const std::string& raw) {
    std::string v = domain::ToLowerAscii(Trim(raw));
    if (v == "true" || v == "1" || v == "yes" || v == "y" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "n" || v == "off") return false;
    return std::nullopt;
}

bool CapsuleService::IsAllowedExtraKey(const std::string& key) {
    static const std::regex allowed("^[a-z0-9]+([:_][a-z0-9]+)*$");
    return std::regex_match(key, allowed);
}

} // namespace reflectcore::application::capsule
