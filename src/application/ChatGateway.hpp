/**
 * @file ChatGateway.hpp
 * @brief Transport-independent chat request pipeline with one tagged failure per request.
 */

#pragma once
#include <cstddef>
#include <string>
#include <variant>
#include <vector>
#include "application/ConversationOrchestrator.hpp"
#include "application/HealthProbe.hpp"

namespace crowdpulse::application {

struct ChatRequest {
    std::string message;
    domain::FilterKey context;
    std::vector<domain::ConversationTurn> history; ///< Oldest first.
};

struct ChatResponse {
    std::string response;
    long long timestampMs = 0;
    std::string model;
    long long tokensUsed = 0;
};

enum class FailureKind {
    Validation,   ///< Request rejected before touching cache or engine.
    Unavailable,  ///< Engine reachable but not ready (or unreachable at pre-check).
    Inference,    ///< Dispatch failed.
    Aggregation,  ///< A row of the partition could not be aggregated.
    Internal      ///< Anything else.
};

std::string FailureKindToString(FailureKind kind);

struct Failure {
    FailureKind kind = FailureKind::Internal;
    std::string cause;
};

using ChatOutcome = std::variant<ChatResponse, Failure>;

/**
 * @class ChatGateway
 * @brief Validates, pre-checks availability, orchestrates, and converts every failure to a Failure.
 */
class ChatGateway {
public:
    static constexpr std::size_t kMaxMessageLength = 500;
    static constexpr std::size_t kMaxTurnLength = 10000;

    ChatGateway(const HealthProbe& probe, const ConversationOrchestrator& orchestrator);

    ChatOutcome send(const ChatRequest& request) const;

    /** @throws ValidationError describing the first violation found. */
    static void Validate(const ChatRequest& request);

    /** @brief Number of UTF-8 code points in @p text. */
    static std::size_t CodePointCount(const std::string& text);

private:
    const HealthProbe& m_probe;
    const ConversationOrchestrator& m_orchestrator;
};

} // namespace crowdpulse::application
