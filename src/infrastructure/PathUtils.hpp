// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace reflectcore::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /// REFLECTCORE_DATA_HOME if set, else <data home>/ReflectCore. Created on demand.
    static std::filesystem::path GetAppDataDir();
    static std::filesystem::path GetAudioDir(const std::filesystem::path& dataRoot);
};

} // namespace reflectcore::infrastructure
