#include "infrastructure/RedactionDictionaryStore.hpp"
#include "infrastructure/JsonMapping.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace reflectcore::infrastructure {

using domain::redaction::RedactionDictionary;

namespace {

std::string Trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

RedactionDictionaryStore::RedactionDictionaryStore(std::string dataRoot, std::shared_ptr<PersistenceService> persistence)
    : m_filePath((std::filesystem::path(dataRoot) / "redaction_dictionary.json").string()),
      m_persistence(std::move(persistence)) {}

RedactionDictionary RedactionDictionaryStore::loadLocked() {
    auto content = m_persistence->readText(m_filePath);
    if (!content) return RedactionDictionary{};
    try {
        return DictionaryFromJson(json::parse(*content));
    } catch (const json::exception& e) {
        std::cerr << "[RedactionDictionaryStore] Error reading dictionary: " << e.what() << std::endl;
        return RedactionDictionary{};
    }
}

RedactionDictionary RedactionDictionaryStore::load() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return loadLocked();
}

RedactionDictionary RedactionDictionaryStore::addToken(const std::string& token) {
    std::lock_guard<std::mutex> lock(m_mutex);
    RedactionDictionary dict = loadLocked();

    std::string cleaned = Trim(token);
    if (cleaned.empty()) return dict;
    bool exists = std::any_of(dict.tokens.begin(), dict.tokens.end(),
                              [&](const std::string& t) { return EqualsIgnoreCase(t, cleaned); });
    if (exists) return dict;

    dict.tokens.push_back(cleaned);
    dict.version += 1;
    m_persistence->saveText(m_filePath, DictionaryToJson(dict).dump(2));
    return dict;
}

RedactionDictionary RedactionDictionaryStore::removeToken(const std::string& token) {
    std::lock_guard<std::mutex> lock(m_mutex);
    RedactionDictionary dict = loadLocked();

    std::string cleaned = Trim(token);
    auto before = dict.tokens.size();
    dict.tokens.erase(std::remove_if(dict.tokens.begin(), dict.tokens.end(),
                                     [&](const std::string& t) { return EqualsIgnoreCase(t, cleaned); }),
                      dict.tokens.end());
    if (dict.tokens.size() == before) return dict;

    dict.version += 1;
    m_persistence->saveText(m_filePath, DictionaryToJson(dict).dump(2));
    return dict;
}

} // namespace reflectcore::infrastructure
