/**
 * @file ReflectCoreApp.hpp
 * @brief Command-line front end and composition root for ReflectCore.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace reflectcore::app {

/**
 * @class ReflectCoreApp
 * @brief Wires repositories, services and the gateway client, then dispatches one command.
 */
class ReflectCoreApp {
public:
    /**
     * @brief Parses the command line and runs the requested command.
     * @return Exit code (0 for success).
     */
    int Run(int argc, char** argv);

private:
    /**
     * @brief Builds every service under the data root. Storage problems surface as exceptions.
     */
    void Init();

    int Dispatch(const std::vector<std::string>& args);
    void PrintUsage() const;

    int CmdImport(const std::vector<std::string>& args);
    int CmdTranscript(const std::vector<std::string>& args);
    int CmdList();
    int CmdShow(const std::vector<std::string>& args);
    int CmdRename(const std::vector<std::string>& args);
    int CmdDelete(const std::vector<std::string>& args);
    int CmdRedact(const std::vector<std::string>& args);
    int CmdReflect(const std::vector<std::string>& args);
    int CmdTalk(const std::vector<std::string>& args);
    int CmdSteps(const std::vector<std::string>& args);
    int CmdCapsule(const std::vector<std::string>& args);
    int CmdPatterns(const std::vector<std::string>& args);
    int CmdDictionary(const std::vector<std::string>& args);

    void OnTurnCompleted(const domain::turn::Turn& turn);

    std::filesystem::path m_dataRoot;
    infrastructure::AppConfig m_config;
    application::AppServices m_services;
};

} // namespace reflectcore::app
