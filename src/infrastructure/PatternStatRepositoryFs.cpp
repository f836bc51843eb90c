/**
 * @file PatternStatRepositoryFs.cpp
 * @brief Implementation of PatternStatRepositoryFs.
 */

#include "infrastructure/PatternStatRepositoryFs.hpp"
#include "infrastructure/JsonMapping.hpp"
#include <filesystem>
#include <iostream>

namespace reflectcore::infrastructure {

namespace fs = std::filesystem;
using domain::learning::PatternKind;
using domain::learning::PatternStat;

PatternStatRepositoryFs::PatternStatRepositoryFs(std::string dataRoot, std::shared_ptr<PersistenceService> persistence)
    : m_filePath((fs::path(dataRoot) / "learning" / "pattern_stats.json").string()),
      m_persistence(std::move(persistence)) {}

void PatternStatRepositoryFs::loadLocked() {
    if (m_loaded) return;
    m_loaded = true;

    auto content = m_persistence->readText(m_filePath);
    if (!content) return;

    try {
        auto j = json::parse(*content);
        if (!j.contains("stats") || !j["stats"].is_array()) return;
        for (const auto& row : j["stats"]) {
            auto stat = PatternStatFromJson(row);
            if (!stat) {
                std::cerr << "[PatternStatRepositoryFs] Skipping row with unknown kind" << std::endl;
                continue;
            }
            m_rows[stat->compositeKey()] = *stat;
        }
    } catch (const json::exception& e) {
        std::cerr << "[PatternStatRepositoryFs] Error reading " << m_filePath << ": " << e.what() << std::endl;
    }
}

void PatternStatRepositoryFs::flushLocked() {
    json rows = json::array();
    for (const auto& [_, stat] : m_rows) {
        rows.push_back(PatternStatToJson(stat));
    }
    json doc = {{"stats", rows}};
    m_persistence->saveText(m_filePath, doc.dump(2));
}

std::optional<PatternStat> PatternStatRepositoryFs::find(PatternKind kind, const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    loadLocked();
    auto it = m_rows.find(domain::learning::KindToString(kind) + "|" + key);
    if (it == m_rows.end()) return std::nullopt;
    return it->second;
}

std::vector<PatternStat> PatternStatRepositoryFs::findAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    loadLocked();
    std::vector<PatternStat> out;
    out.reserve(m_rows.size());
    for (const auto& [_, stat] : m_rows) {
        out.push_back(stat);
    }
    return out;
}

void PatternStatRepositoryFs::upsert(const PatternStat& stat) {
    std::lock_guard<std::mutex> lock(m_mutex);
    loadLocked();
    auto key = stat.compositeKey();
    auto previous = m_rows.find(key);
    std::optional<PatternStat> rollback;
    if (previous != m_rows.end()) rollback = previous->second;

    m_rows[key] = stat;
    try {
        flushLocked();
    } catch (const std::exception&) {
        if (rollback) {
            m_rows[key] = *rollback;
        } else {
            m_rows.erase(key);
        }
        throw;
    }
}

void PatternStatRepositoryFs::removeAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_loaded = true;
    m_rows.clear();
    flushLocked();
}

} // namespace reflectcore::infrastructure
