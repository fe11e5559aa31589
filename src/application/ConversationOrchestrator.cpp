/**
 * @file ConversationOrchestrator.cpp
 * @brief Implementation of ConversationOrchestrator.
 */

#include "application/ConversationOrchestrator.hpp"
#include "application/ResponseNormalizer.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <iostream>

namespace crowdpulse::application {

namespace {

// First n code points of a UTF-8 string, for log previews.
std::string Utf8Prefix(const std::string& text, std::size_t n) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (count == n) return text.substr(0, i) + "...";
            ++count;
        }
    }
    return text;
}

} // namespace

ConversationOrchestrator::ConversationOrchestrator(const AggregationEngine& aggregation,
                                                   std::shared_ptr<domain::InferenceEngine> engine,
                                                   std::string model)
    : m_aggregation(aggregation), m_engine(std::move(engine)), m_model(std::move(model)) {}

std::vector<domain::ChatMessage> ConversationOrchestrator::AssembleMessages(
    const std::string& systemPrompt,
    const std::vector<domain::ConversationTurn>& history,
    const std::string& message) {
    const std::size_t kept = std::min(history.size(), kHistoryLimit);

    std::vector<domain::ChatMessage> messages;
    messages.reserve(kept + 2);
    messages.push_back({domain::ChatMessage::Role::System, systemPrompt});
    for (auto it = history.end() - static_cast<std::ptrdiff_t>(kept); it != history.end(); ++it) {
        messages.push_back(it->toMessage());
    }
    messages.push_back({domain::ChatMessage::Role::User, message});
    return messages;
}

domain::InferenceResult ConversationOrchestrator::orchestrate(
    const std::string& message,
    const domain::FilterKey& key,
    const std::vector<domain::ConversationTurn>& history) const {
    const auto summary = m_aggregation.aggregate(key);
    const auto messages = AssembleMessages(m_promptBuilder.build(summary, key), history, message);

    std::cout << "[ConversationOrchestrator] " << key.toString() << " (" << summary.totalRecords
              << " records, " << messages.size() << " messages): " << Utf8Prefix(message, 50) << std::endl;

    domain::InferenceResult result;
    try {
        result = NormalizeReply(m_engine->chat(m_model, messages), m_model);
    } catch (const domain::InferenceError&) {
        throw;
    } catch (const std::exception& e) {
        throw domain::InferenceError("Failed to generate response from " + m_engine->endpoint() + ": " + e.what());
    }

    std::cout << "[ConversationOrchestrator] Response generated (" << result.tokensUsed << " tokens)" << std::endl;
    return result;
}

} // namespace crowdpulse::application
