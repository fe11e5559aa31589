/**
 * @file ConversationOrchestrator.hpp
 * @brief Assembles a grounded chat request and dispatches it to the inference engine.
 */

#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "application/AggregationEngine.hpp"
#include "application/PromptBuilder.hpp"
#include "domain/ConversationTurn.hpp"
#include "domain/InferenceEngine.hpp"

namespace crowdpulse::application {

/**
 * @class ConversationOrchestrator
 * @brief Stateless per-request pipeline: aggregate, render prompt, assemble messages, dispatch, normalize.
 *
 * Holds no conversation state; the caller owns the history and passes it on every call.
 */
class ConversationOrchestrator {
public:
    /** @brief Most recent history turns forwarded to the engine. */
    static constexpr std::size_t kHistoryLimit = 20;

    ConversationOrchestrator(const AggregationEngine& aggregation,
                             std::shared_ptr<domain::InferenceEngine> engine,
                             std::string model);

    /**
     * @brief Answers @p message grounded on the summary of @p key.
     * @throws ValidationError if the key is out of range.
     * @throws InternalAggregationError if the partition cannot be aggregated.
     * @throws InferenceError if the single dispatch attempt fails.
     */
    domain::InferenceResult orchestrate(const std::string& message,
                                        const domain::FilterKey& key,
                                        const std::vector<domain::ConversationTurn>& history) const;

    /**
     * @brief [system] + last kHistoryLimit history turns (oldest first) + [user message].
     */
    static std::vector<domain::ChatMessage> AssembleMessages(const std::string& systemPrompt,
                                                             const std::vector<domain::ConversationTurn>& history,
                                                             const std::string& message);

private:
    const AggregationEngine& m_aggregation;
    PromptBuilder m_promptBuilder;
    std::shared_ptr<domain::InferenceEngine> m_engine;
    std::string m_model;
};

} // namespace crowdpulse::application
