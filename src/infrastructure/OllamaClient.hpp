/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace crowdpulse::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434,
                 int chatTimeoutSeconds = 600, int probeTimeoutSeconds = 5);

    /**
     * @brief Sends a non-streaming POST request to /api/chat.
     * @return The parsed response body.
     * @throws domain::InferenceError on connection failure, non-200 status or unparsable body.
     */
    nlohmann::json chat(const std::string& model, const nlohmann::json& messages);

    /**
     * @brief Fetches available models from /api/tags.
     * @throws domain::InferenceError when the manifest cannot be fetched.
     */
    std::vector<std::string> getAvailableModels();

    /** @brief "http://host:port". */
    std::string endpoint() const;

private:
    std::string m_host;
    int m_port;
    int m_chatTimeoutSeconds;
    int m_probeTimeoutSeconds;
};

} // namespace crowdpulse::infrastructure
