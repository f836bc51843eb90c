/**
 * @file PatternStatRepositoryFs.hpp
 * @brief Pattern statistics table held in memory and persisted as one JSON document.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "domain/learning/PatternStatRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace reflectcore::infrastructure {

class PatternStatRepositoryFs : public domain::learning::PatternStatRepository {
public:
    PatternStatRepositoryFs(std::string dataRoot, std::shared_ptr<PersistenceService> persistence);

    std::optional<domain::learning::PatternStat> find(domain::learning::PatternKind kind,
                                                      const std::string& key) override;
    std::vector<domain::learning::PatternStat> findAll() override;
    void upsert(const domain::learning::PatternStat& stat) override;
    void removeAll() override;

private:
    void loadLocked();
    void flushLocked();

    std::string m_filePath; ///< <root>/learning/pattern_stats.json
    std::shared_ptr<PersistenceService> m_persistence;

    std::mutex m_mutex;
    bool m_loaded = false;
    std::map<std::string, domain::learning::PatternStat> m_rows; ///< keyed by compositeKey()
};

} // namespace reflectcore::infrastructure
