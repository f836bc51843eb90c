#include "infrastructure/CapsuleRepositoryFs.hpp"
#include "infrastructure/JsonMapping.hpp"
#include <filesystem>
#include <iostream>

namespace reflectcore::infrastructure {

CapsuleRepositoryFs::CapsuleRepositoryFs(std::string dataRoot, std::shared_ptr<PersistenceService> persistence)
    : m_filePath((std::filesystem::path(dataRoot) / "capsule.json").string()),
      m_persistence(std::move(persistence)) {}

std::optional<domain::capsule::Capsule> CapsuleRepositoryFs::load() {
    auto content = m_persistence->readText(m_filePath);
    if (!content) return std::nullopt;

    try {
        return CapsuleFromJson(json::parse(*content));
    } catch (const json::exception& e) {
        // A corrupt capsule is treated as absent; the service recreates defaults.
        std::cerr << "[CapsuleRepositoryFs] Error reading capsule.json: " << e.what() << std::endl;
        return std::nullopt;
    }
}

void CapsuleRepositoryFs::save(const domain::capsule::Capsule& capsule) {
    m_persistence->saveText(m_filePath, CapsuleToJson(capsule).dump(2));
}

} // namespace reflectcore::infrastructure
