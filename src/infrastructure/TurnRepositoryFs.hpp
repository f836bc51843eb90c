/**
 * @file TurnRepositoryFs.hpp
 * @brief File-system backed TurnRepository: one JSON file per Turn, one NDJSON log per Turn's redactions.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/turn/TurnRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace reflectcore::infrastructure {

class TurnRepositoryFs : public domain::turn::TurnRepository {
public:
    TurnRepositoryFs(std::string dataRoot, std::shared_ptr<PersistenceService> persistence);

    void save(const domain::turn::Turn& turn) override;
    std::optional<domain::turn::Turn> findById(const std::string& id) override;
    std::vector<domain::turn::Turn> findAll() override;
    bool remove(const std::string& id) override;

    void appendRedaction(const domain::turn::RedactionRecord& record) override;
    std::vector<domain::turn::RedactionRecord> redactionsFor(const std::string& turnId) override;
    void removeRedactions(const std::string& turnId) override;

private:
    // Structure: <root>/turns/<id>.json and <root>/redactions/<id>.ndjson
    std::string getTurnFilePath(const std::string& id) const;
    std::string getRedactionLogPath(const std::string& turnId) const;

    std::string m_dataRoot;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace reflectcore::infrastructure
