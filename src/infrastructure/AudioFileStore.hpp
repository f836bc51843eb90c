/**
 * @file AudioFileStore.hpp
 * @brief Resolves and removes captured audio files under the data root.
 */

#pragma once

#include <filesystem>
#include <string>
#include "domain/turn/TurnRepository.hpp"

namespace reflectcore::infrastructure {

class AudioFileStore : public domain::turn::AudioStore {
public:
    explicit AudioFileStore(std::string audioRoot);

    bool removeAudio(const std::string& audioPath) override;

    /**
     * @brief Maps a stored reference to a path. Strips a "file://" scheme;
     * relative references resolve against the audio root.
     */
    std::filesystem::path resolve(const std::string& audioPath) const;

private:
    std::string m_audioRoot;
};

} // namespace reflectcore::infrastructure
