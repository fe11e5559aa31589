/**
 * @file OllamaAdapter.hpp
 * @brief InferenceEngine backed by a local Ollama server.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/InferenceEngine.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace crowdpulse::infrastructure {

/**
 * @enum ReplyShape
 * @brief Which reply representation the adapter hands back; fixed at construction.
 */
enum class ReplyShape {
    Structured, ///< domain::StructuredReply with typed fields.
    Mapping     ///< The raw nested JSON mapping of /api/chat.
};

/** @throws ConfigError for anything but "structured" or "mapping". */
ReplyShape ParseReplyShape(const std::string& value);

/**
 * @class OllamaAdapter
 * @brief Implements domain::InferenceEngine using the Ollama REST API.
 */
class OllamaAdapter : public domain::InferenceEngine {
public:
    OllamaAdapter(OllamaClient client, ReplyShape shape = ReplyShape::Structured);

    /** @see domain::InferenceEngine::listModels */
    std::vector<std::string> listModels() override;

    /** @see domain::InferenceEngine::chat */
    domain::EngineReply chat(const std::string& model, const std::vector<domain::ChatMessage>& messages) override;

    std::string endpoint() const override { return m_client.endpoint(); }

    ReplyShape getReplyShape() const { return m_shape; }

    /** @brief Wire form of a message list. */
    static nlohmann::json ToWireMessages(const std::vector<domain::ChatMessage>& messages);

    /** @brief Typed view of a /api/chat body. */
    static domain::StructuredReply ToStructured(const nlohmann::json& body);

private:
    OllamaClient m_client;
    ReplyShape m_shape;
};

} // namespace crowdpulse::infrastructure
