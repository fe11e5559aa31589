/**
 * @file OllamaAdapter.cpp
 * @brief Implementation of the OllamaAdapter class.
 */
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "domain/Errors.hpp"

using json = nlohmann::json;

namespace crowdpulse::infrastructure {

namespace {

std::optional<long long> OptionalCounter(const json& body, const char* field) {
    auto it = body.find(field);
    if (it == body.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<long long>();
}

} // namespace

ReplyShape ParseReplyShape(const std::string& value) {
    if (value == "structured") return ReplyShape::Structured;
    if (value == "mapping") return ReplyShape::Mapping;
    throw ConfigError("Unknown reply_shape '" + value + "' (expected structured or mapping)");
}

OllamaAdapter::OllamaAdapter(OllamaClient client, ReplyShape shape)
    : m_client(std::move(client)), m_shape(shape) {}

std::vector<std::string> OllamaAdapter::listModels() {
    return m_client.getAvailableModels();
}

json OllamaAdapter::ToWireMessages(const std::vector<domain::ChatMessage>& messages) {
    json wire = json::array();
    for (const auto& msg : messages) {
        wire.push_back({
            {"role", domain::ChatMessage::RoleToString(msg.role)},
            {"content", msg.content}
        });
    }
    return wire;
}

domain::StructuredReply OllamaAdapter::ToStructured(const json& body) {
    if (!body.is_object() || !body.contains("message") || !body["message"].is_object() ||
        !body["message"].contains("content") || !body["message"]["content"].is_string()) {
        throw domain::InferenceError("Malformed chat reply: missing message.content");
    }

    domain::StructuredReply reply;
    reply.text = body["message"]["content"].get<std::string>();
    if (body.contains("model") && body["model"].is_string()) {
        reply.model = body["model"].get<std::string>();
    }
    reply.evalCount = OptionalCounter(body, "eval_count");
    reply.promptEvalCount = OptionalCounter(body, "prompt_eval_count");
    return reply;
}

domain::EngineReply OllamaAdapter::chat(const std::string& model, const std::vector<domain::ChatMessage>& messages) {
    json body = m_client.chat(model, ToWireMessages(messages));
    if (m_shape == ReplyShape::Mapping) {
        return domain::EngineReply(std::in_place_type<domain::MappingReply>, std::move(body));
    }
    return domain::EngineReply(std::in_place_type<domain::StructuredReply>, ToStructured(body));
}

} // namespace crowdpulse::infrastructure
