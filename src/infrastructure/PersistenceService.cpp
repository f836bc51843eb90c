/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include "domain/DomainErrors.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace reflectcore::infrastructure {

namespace fs = std::filesystem;

void PersistenceService::saveText(const std::string& filename, const std::string& content) {
    std::lock_guard<std::mutex> lock(m_mutex);
    performAtomicWrite(filename, content);
}

void PersistenceService::appendText(const std::string& filename, const std::string& lines) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string existing;
    if (fs::exists(filename)) {
        std::ifstream in(filename, std::ios::binary);
        if (!in) {
            throw domain::StorageError("Failed to open for append: " + filename);
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        existing = buffer.str();
        if (!existing.empty() && existing.back() != '\n') {
            existing += "\n";
        }
    }
    performAtomicWrite(filename, existing + lines);
}

std::optional<std::string> PersistenceService::readText(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!fs::exists(filename)) {
        return std::nullopt;
    }
    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        throw domain::StorageError("Failed to open for read: " + filename);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool PersistenceService::removeFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    bool removed = fs::remove(filename, ec);
    if (ec) {
        throw domain::StorageError("Failed to remove " + filename + ": " + ec.message());
    }
    return removed;
}

void PersistenceService::performAtomicWrite(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;

    // Unique temp path per operation: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            throw domain::StorageError("Error creating directories for " + filename + ": " + ec.message());
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw domain::StorageError("Failed to open temp file: " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw domain::StorageError("Write failed: " + tempPath.string());
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Rename failed: " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw domain::StorageError("Rename failed for " + filename + ": " + ec.message());
    }
}

} // namespace reflectcore::infrastructure
