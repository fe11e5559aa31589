/**
 * @file CrowdPulseApp.hpp
 * @brief Command-line front end of the crowd analytics assistant.
 */

#pragma once

#include <string>
#include <vector>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace crowdpulse::app {

/**
 * @class CrowdPulseApp
 * @brief Loads configuration and dataset once, then runs a single command.
 */
class CrowdPulseApp {
public:
    /**
     * @brief Entry point.
     * @return 0 on success, 1 on failure, 2 on usage errors.
     */
    int Run(int argc, char** argv);

private:
    bool Init(const std::string& configPath);
    int Dispatch(const std::vector<std::string>& args);

    int CmdSummary(const domain::FilterKey& key);
    int CmdExport(const domain::FilterKey& key);
    int CmdPrompt(const domain::FilterKey& key);
    int CmdChat(const domain::FilterKey& key, const std::string& message, const std::string& historyPath);
    int CmdHealth();

    static void PrintUsage();

    infrastructure::AppConfig m_config;
    application::AppServices m_services;
};

/**
 * @brief Reads a JSON array of {"role", "content", "timestamp"?} turns.
 * @throws ValidationError on unknown roles or malformed entries.
 * @throws ConfigError if the file cannot be read or parsed.
 */
std::vector<domain::ConversationTurn> LoadHistory(const std::string& path);

} // namespace crowdpulse::app
