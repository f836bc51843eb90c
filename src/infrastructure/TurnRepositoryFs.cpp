/**
 * @file TurnRepositoryFs.cpp
 * @brief Implementation of TurnRepositoryFs.
 */

#include "infrastructure/TurnRepositoryFs.hpp"
#include "infrastructure/JsonMapping.hpp"
#include <filesystem>
#include <iostream>
#include <sstream>

namespace reflectcore::infrastructure {

namespace fs = std::filesystem;
using domain::turn::RedactionRecord;
using domain::turn::Turn;

TurnRepositoryFs::TurnRepositoryFs(std::string dataRoot, std::shared_ptr<PersistenceService> persistence)
    : m_dataRoot(std::move(dataRoot)), m_persistence(std::move(persistence)) {}

std::string TurnRepositoryFs::getTurnFilePath(const std::string& id) const {
    return (fs::path(m_dataRoot) / "turns" / (id + ".json")).string();
}

std::string TurnRepositoryFs::getRedactionLogPath(const std::string& turnId) const {
    return (fs::path(m_dataRoot) / "redactions" / (turnId + ".ndjson")).string();
}

void TurnRepositoryFs::save(const Turn& turn) {
    m_persistence->saveText(getTurnFilePath(turn.id), TurnToJson(turn).dump(2));
}

std::optional<Turn> TurnRepositoryFs::findById(const std::string& id) {
    auto content = m_persistence->readText(getTurnFilePath(id));
    if (!content) return std::nullopt;

    try {
        return TurnFromJson(json::parse(*content));
    } catch (const json::exception& e) {
        std::cerr << "[TurnRepositoryFs] Corrupt record " << id << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::vector<Turn> TurnRepositoryFs::findAll() {
    std::vector<Turn> results;
    fs::path dir = fs::path(m_dataRoot) / "turns";
    if (!fs::exists(dir)) return results;

    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        auto turn = findById(entry.path().stem().string());
        if (turn) results.push_back(std::move(*turn));
    }
    return results;
}

bool TurnRepositoryFs::remove(const std::string& id) {
    return m_persistence->removeFile(getTurnFilePath(id));
}

void TurnRepositoryFs::appendRedaction(const RedactionRecord& record) {
    m_persistence->appendText(getRedactionLogPath(record.turnId), RedactionRecordToJson(record).dump() + "\n");
}

std::vector<RedactionRecord> TurnRepositoryFs::redactionsFor(const std::string& turnId) {
    std::vector<RedactionRecord> results;
    auto content = m_persistence->readText(getRedactionLogPath(turnId));
    if (!content) return results;

    std::istringstream in(*content);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        try {
            results.push_back(RedactionRecordFromJson(json::parse(line)));
        } catch (const json::exception& e) {
            std::cerr << "[TurnRepositoryFs] Skipping malformed redaction line for " << turnId
                      << ": " << e.what() << std::endl;
        }
    }
    return results;
}

void TurnRepositoryFs::removeRedactions(const std::string& turnId) {
    m_persistence->removeFile(getRedactionLogPath(turnId));
}

} // namespace reflectcore::infrastructure
