/**
 * @file AudioFileStore.cpp
 * @brief Implementation of AudioFileStore.
 */

#include "infrastructure/AudioFileStore.hpp"
#include "domain/DomainErrors.hpp"

namespace reflectcore::infrastructure {

namespace fs = std::filesystem;

AudioFileStore::AudioFileStore(std::string audioRoot) : m_audioRoot(std::move(audioRoot)) {}

fs::path AudioFileStore::resolve(const std::string& audioPath) const {
    static const std::string kScheme = "file://";
    std::string ref = audioPath;
    if (ref.compare(0, kScheme.size(), kScheme) == 0) {
        ref = ref.substr(kScheme.size());
    }
    fs::path p(ref);
    if (p.is_relative()) {
        p = fs::path(m_audioRoot) / p;
    }
    return p;
}

bool AudioFileStore::removeAudio(const std::string& audioPath) {
    if (audioPath.empty()) return true;

    fs::path p = resolve(audioPath);
    std::error_code ec;
    fs::remove(p, ec);
    if (ec) {
        throw domain::StorageError("Failed to remove audio " + p.string() + ": " + ec.message());
    }
    return true;
}

} // namespace reflectcore::infrastructure
