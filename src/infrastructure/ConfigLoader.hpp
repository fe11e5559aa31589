/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the service configuration (settings.json).
 *
 * Provides one place for configuration parsing, so services receive plain values
 * instead of reading files or the environment themselves.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace crowdpulse::infrastructure {

/** @brief Unreadable or malformed configuration or dataset file. */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @struct AppConfig
 * @brief Construct-once settings shared by every service.
 */
struct AppConfig {
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string ollamaModel = "qwen2.5:7b";
    std::string replyShape = "structured";
    std::string dataPath = "data/data.csv";
    int chatTimeoutSeconds = 600;
    int probeTimeoutSeconds = 5;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from @p path, then applies environment overrides.
     * A missing file yields the defaults.
     * @throws ConfigError if the file exists but cannot be parsed or has wrongly typed keys.
     */
    static AppConfig Load(const std::string& path);

    /**
     * @brief Applies OLLAMA_HOST, OLLAMA_PORT, OLLAMA_MODEL and CROWDPULSE_DATA when set.
     * @throws ConfigError if OLLAMA_PORT is not a number.
     */
    static void ApplyEnvironment(AppConfig& config);
};

} // namespace crowdpulse::infrastructure
