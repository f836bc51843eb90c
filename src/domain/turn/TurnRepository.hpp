/**
 * @file TurnRepository.hpp
 * @brief Persistence port for Turns and their redaction history.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/turn/Turn.hpp"
#include "domain/turn/RedactionRecord.hpp"

namespace reflectcore::domain::turn {

class TurnRepository {
public:
    virtual ~TurnRepository() = default;

    // Insert or replace. Throws StorageError on failure.
    virtual void save(const Turn& turn) = 0;

    virtual std::optional<Turn> findById(const std::string& id) = 0;

    virtual std::vector<Turn> findAll() = 0;

    // Removes the record. Returns false if it did not exist.
    virtual bool remove(const std::string& id) = 0;

    // Redaction provenance is append-only.
    virtual void appendRedaction(const RedactionRecord& record) = 0;
    virtual std::vector<RedactionRecord> redactionsFor(const std::string& turnId) = 0;
    virtual void removeRedactions(const std::string& turnId) = 0;
};

/**
 * @class AudioStore
 * @brief Owner of captured audio files referenced by Turns.
 */
class AudioStore {
public:
    virtual ~AudioStore() = default;

    /**
     * @brief Removes the audio file at @p audioPath.
     * @return true if the file was removed or did not exist.
     * @throws StorageError if the file exists but could not be removed.
     */
    virtual bool removeAudio(const std::string& audioPath) = 0;
};

} // namespace reflectcore::domain::turn
