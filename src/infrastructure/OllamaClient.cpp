#include "infrastructure/OllamaClient.hpp"
#include "domain/Errors.hpp"
#include <httplib.h>
#include <iostream>

namespace crowdpulse::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
}

OllamaClient::OllamaClient(const std::string& host, int port, int chatTimeoutSeconds, int probeTimeoutSeconds)
    : m_host(host), m_port(port),
      m_chatTimeoutSeconds(chatTimeoutSeconds), m_probeTimeoutSeconds(probeTimeoutSeconds) {}

std::string OllamaClient::endpoint() const {
    return "http://" + m_host + ":" + std::to_string(m_port);
}

json OllamaClient::chat(const std::string& model, const json& messages) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(m_probeTimeoutSeconds);
    cli.set_read_timeout(m_chatTimeoutSeconds);

    json requestData = {
        {"model", model},
        {"messages", messages},
        {"stream", false},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };

    auto res = cli.Post("/api/chat", requestData.dump(), "application/json");
    if (!res) {
        std::string cause = httplib::to_string(res.error());
        std::cerr << "[OllamaClient] Connection failed: " << cause << std::endl;
        throw domain::InferenceError("Cannot reach Ollama at " + endpoint() + ": " + cause);
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        throw domain::InferenceError("Ollama at " + endpoint() + " returned HTTP " +
                                     std::to_string(res->status) + ": " + res->body);
    }

    try {
        return json::parse(res->body);
    } catch (const json::parse_error& e) {
        std::cerr << "[OllamaClient] Chat JSON Parse Error: " << e.what() << std::endl;
        throw domain::InferenceError("Unparsable chat reply from " + endpoint() + ": " + e.what());
    }
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(m_probeTimeoutSeconds);
    cli.set_read_timeout(m_probeTimeoutSeconds);

    auto res = cli.Get("/api/tags");
    if (!res) {
        throw domain::InferenceError(httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw domain::InferenceError("HTTP " + std::to_string(res->status) + " from /api/tags");
    }

    std::vector<std::string> models;
    try {
        auto body = json::parse(res->body);
        if (body.contains("models") && body["models"].is_array()) {
            for (const auto& item : body["models"]) {
                // Newer servers report "model", older ones only "name".
                if (item.contains("name") && item["name"].is_string()) {
                    models.push_back(item["name"].get<std::string>());
                } else if (item.contains("model") && item["model"].is_string()) {
                    models.push_back(item["model"].get<std::string>());
                }
            }
        }
    } catch (const json::exception& e) {
        throw domain::InferenceError(std::string("Unparsable model manifest: ") + e.what());
    }
    return models;
}

} // namespace crowdpulse::infrastructure
