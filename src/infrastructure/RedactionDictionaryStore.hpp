/**
 * @file RedactionDictionaryStore.hpp
 * @brief Persists the user's redaction token list. Every edit bumps the dictionary version.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include "domain/redaction/RedactionDictionary.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace reflectcore::infrastructure {

class RedactionDictionaryStore {
public:
    RedactionDictionaryStore(std::string dataRoot, std::shared_ptr<PersistenceService> persistence);

    domain::redaction::RedactionDictionary load();

    /**
     * @brief Adds a token (trimmed, case-insensitive duplicate check).
     * @return The updated dictionary. Unchanged (same version) if the token was blank or present.
     */
    domain::redaction::RedactionDictionary addToken(const std::string& token);

    domain::redaction::RedactionDictionary removeToken(const std::string& token);

private:
    domain::redaction::RedactionDictionary loadLocked();

    std::string m_filePath; ///< <root>/redaction_dictionary.json
    std::shared_ptr<PersistenceService> m_persistence;
    std::mutex m_mutex;
};

} // namespace reflectcore::infrastructure
