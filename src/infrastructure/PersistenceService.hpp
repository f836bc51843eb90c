/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace reflectcore::infrastructure {

/**
 * @class PersistenceService
 * @brief Serializes all writes through one mutex and writes atomically (temp file, then rename).
 *
 * Failures throw domain::StorageError so record mutations are never silently lost.
 */
class PersistenceService {
public:
    PersistenceService() = default;

    /**
     * @brief Atomically replaces @p filename with @p content, creating parent directories.
     * @throws domain::StorageError on any I/O failure.
     */
    void saveText(const std::string& filename, const std::string& content);

    /**
     * @brief Appends @p lines to @p filename under the write lock (read, concat, atomic rewrite).
     */
    void appendText(const std::string& filename, const std::string& lines);

    /**
     * @brief Reads the whole file, or nullopt if it does not exist.
     */
    std::optional<std::string> readText(const std::string& filename) const;

    /**
     * @brief Removes a file. Returns false if it did not exist.
     * @throws domain::StorageError if removal failed.
     */
    bool removeFile(const std::string& filename);

private:
    void performAtomicWrite(const std::string& filename, const std::string& content);

    mutable std::mutex m_mutex;
};

} // namespace reflectcore::infrastructure
