/**
 * @file CapsuleRepositoryFs.hpp
 * @brief Stores the singleton Capsule at <root>/capsule.json.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/capsule/Capsule.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace reflectcore::infrastructure {

class CapsuleRepositoryFs : public domain::capsule::CapsuleRepository {
public:
    CapsuleRepositoryFs(std::string dataRoot, std::shared_ptr<PersistenceService> persistence);

    std::optional<domain::capsule::Capsule> load() override;
    void save(const domain::capsule::Capsule& capsule) override;

private:
    std::string m_filePath;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace reflectcore::infrastructure
