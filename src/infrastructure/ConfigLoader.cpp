/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "infrastructure/PersistenceService.hpp"

namespace reflectcore::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

json ReadSettings(const fs::path& configPath) {
    if (!fs::exists(configPath)) {
        return json::object();
    }
    try {
        std::ifstream f(configPath);
        json j;
        f >> j;
        if (j.is_object()) return j;
        std::cerr << "[ConfigLoader] settings.json is not an object, ignoring" << std::endl;
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
    }
    return json::object();
}

void ApplyEnvOverride(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value && *value) {
        target = value;
    }
}

} // namespace

AppConfig ConfigLoader::Load(const fs::path& dataRoot) {
    AppConfig config;
    json j = ReadSettings(dataRoot / "settings.json");

    if (j.contains("gateway") && j["gateway"].is_object()) {
        const auto& g = j["gateway"];
        config.gateway.enabled = g.value("enabled", config.gateway.enabled);
        config.gateway.baseUrl = g.value("base_url", config.gateway.baseUrl);
        config.gateway.anonKey = g.value("anon_key", config.gateway.anonKey);
        config.gateway.trace = g.value("trace", config.gateway.trace);
    }
    config.client = j.value("client", config.client);
    config.appVersion = j.value("app_version", config.appVersion);
    if (j.contains("learning") && j["learning"].is_object()) {
        double days = j["learning"].value("default_half_life_days", config.defaultHalfLifeDays);
        if (days >= 1.0) {
            config.defaultHalfLifeDays = days;
        } else {
            std::cerr << "[ConfigLoader] Ignoring default_half_life_days < 1" << std::endl;
        }
    }

    ApplyEnvOverride("REFLECTCORE_GATEWAY_URL", config.gateway.baseUrl);
    ApplyEnvOverride("REFLECTCORE_GATEWAY_KEY", config.gateway.anonKey);
    return config;
}

void ConfigLoader::Save(const fs::path& dataRoot, const AppConfig& config) {
    fs::path configPath = dataRoot / "settings.json";
    json j = ReadSettings(configPath);

    j["gateway"]["enabled"] = config.gateway.enabled;
    j["gateway"]["base_url"] = config.gateway.baseUrl;
    j["gateway"]["anon_key"] = config.gateway.anonKey;
    j["gateway"]["trace"] = config.gateway.trace;
    j["client"] = config.client;
    j["app_version"] = config.appVersion;
    j["learning"]["default_half_life_days"] = config.defaultHalfLifeDays;

    PersistenceService persistence;
    persistence.saveText(configPath.string(), j.dump(4));
}

} // namespace reflectcore::infrastructure
