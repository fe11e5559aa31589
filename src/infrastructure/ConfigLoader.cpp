/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace crowdpulse::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigError(std::string("settings.json: invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    AppConfig config;

    if (!std::filesystem::exists(path)) {
        std::cout << "[ConfigLoader] " << path << " not found, using defaults." << std::endl;
    } else {
        std::ifstream f(path);
        if (!f.is_open()) {
            throw ConfigError("Cannot open " + path);
        }

        nlohmann::json j;
        try {
            f >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError("Error reading " + path + ": " + e.what());
        }
        if (!j.is_object()) {
            throw ConfigError(path + " must contain a JSON object");
        }

        ReadKey(j, "ollama_host", config.ollamaHost);
        ReadKey(j, "ollama_port", config.ollamaPort);
        ReadKey(j, "ollama_model", config.ollamaModel);
        ReadKey(j, "reply_shape", config.replyShape);
        ReadKey(j, "data_path", config.dataPath);
        ReadKey(j, "chat_timeout_seconds", config.chatTimeoutSeconds);
        ReadKey(j, "probe_timeout_seconds", config.probeTimeoutSeconds);
        std::cout << "[ConfigLoader] Loaded " << path << std::endl;
    }

    ApplyEnvironment(config);
    return config;
}

void ConfigLoader::ApplyEnvironment(AppConfig& config) {
    if (const char* host = std::getenv("OLLAMA_HOST")) {
        config.ollamaHost = host;
    }
    if (const char* port = std::getenv("OLLAMA_PORT")) {
        try {
            config.ollamaPort = std::stoi(port);
        } catch (const std::exception&) {
            throw ConfigError(std::string("OLLAMA_PORT is not a number: ") + port);
        }
    }
    if (const char* model = std::getenv("OLLAMA_MODEL")) {
        config.ollamaModel = model;
    }
    if (const char* data = std::getenv("CROWDPULSE_DATA")) {
        config.dataPath = data;
    }
}

} // namespace crowdpulse::infrastructure
