/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Environment variables take precedence over the file:
 * REFLECTCORE_GATEWAY_URL and REFLECTCORE_GATEWAY_KEY.
 */

#pragma once

#include <filesystem>
#include <string>
#include "domain/learning/PatternStat.hpp"

namespace reflectcore::infrastructure {

struct GatewaySettings {
    bool enabled = true;
    std::string baseUrl;      ///< e.g. https://example.org/functions/v1
    std::string anonKey;
    bool trace = false;       ///< Log request fingerprints and response snippets.

    bool isConfigured() const { return enabled && !baseUrl.empty() && !anonKey.empty(); }
};

struct AppConfig {
    GatewaySettings gateway;
    std::string client = "reflectcore-cli";
    std::string appVersion = "0.1.0";
    double defaultHalfLifeDays = domain::learning::kDefaultHalfLifeDays;
};

class ConfigLoader {
public:
    /**
     * @brief Reads <dataRoot>/settings.json. Missing or unreadable files yield defaults.
     */
    static AppConfig Load(const std::filesystem::path& dataRoot);

    /**
     * @brief Writes the known keys back to settings.json, preserving any other keys.
     */
    static void Save(const std::filesystem::path& dataRoot, const AppConfig& config);
};

} // namespace reflectcore::infrastructure
