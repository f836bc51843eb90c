#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace reflectcore::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path EnsureDir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[PathUtils] Could not create " << dir << ": " << ec.message() << std::endl;
    }
    return dir;
}

} // namespace

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetAppDataDir() {
    const char* overrideDir = std::getenv("REFLECTCORE_DATA_HOME");
    if (overrideDir && *overrideDir) {
        return EnsureDir(fs::path(overrideDir));
    }
    return EnsureDir(GetDataHome() / "ReflectCore");
}

fs::path PathUtils::GetAudioDir(const fs::path& dataRoot) {
    return EnsureDir(dataRoot / "audio");
}

} // namespace reflectcore::infrastructure
