/**
 * @file InferenceEngine.hpp
 * @brief Interface to the external conversational inference engine.
 */

#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/ConversationTurn.hpp"

namespace crowdpulse::domain {

/**
 * @struct StructuredReply
 * @brief Reply shape with named accessors (typed client bindings).
 */
struct StructuredReply {
    std::string text;
    std::string model;
    std::optional<long long> evalCount;       ///< Generated tokens.
    std::optional<long long> promptEvalCount; ///< Prompt tokens.
};

/**
 * @brief Reply shape as the raw nested mapping of the chat endpoint:
 * {"model": ..., "message": {"content": ...}, "eval_count": ..., "prompt_eval_count": ...}.
 */
using MappingReply = nlohmann::json;

/** @brief Either reply shape; which one an engine produces is fixed when it is constructed. */
using EngineReply = std::variant<StructuredReply, MappingReply>;

/**
 * @struct InferenceResult
 * @brief Normalized outcome of a chat round-trip.
 */
struct InferenceResult {
    std::string text;
    std::string model;
    long long tokensUsed = 0;
};

/**
 * @class InferenceEngine
 * @brief Blocking client of the inference engine, shared for the process lifetime.
 */
class InferenceEngine {
public:
    virtual ~InferenceEngine() = default;

    /**
     * @brief Names of the models the engine can serve.
     * @throws InferenceError when the manifest cannot be fetched.
     */
    virtual std::vector<std::string> listModels() = 0;

    /**
     * @brief Sends one chat request. Exactly one attempt is made.
     * @throws InferenceError on transport or engine failure.
     */
    virtual EngineReply chat(const std::string& model, const std::vector<ChatMessage>& messages) = 0;

    /** @brief Target endpoint, used in error messages (e.g. "http://localhost:11434"). */
    virtual std::string endpoint() const = 0;
};

} // namespace crowdpulse::domain
