/**
 * @file ChatGateway.cpp
 * @brief Implementation of ChatGateway.
 */

#include "application/ChatGateway.hpp"
#include "domain/Errors.hpp"
#include <chrono>
#include <iostream>

namespace crowdpulse::application {

namespace {

long long NowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

Failure Fail(FailureKind kind, const std::string& cause) {
    std::cerr << "[ChatGateway] " << FailureKindToString(kind) << ": " << cause << std::endl;
    return Failure{kind, cause};
}

} // namespace

std::string FailureKindToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::Validation: return "validation";
        case FailureKind::Unavailable: return "unavailable";
        case FailureKind::Inference: return "inference";
        case FailureKind::Aggregation: return "aggregation";
        case FailureKind::Internal: return "internal";
    }
    return "internal";
}

ChatGateway::ChatGateway(const HealthProbe& probe, const ConversationOrchestrator& orchestrator)
    : m_probe(probe), m_orchestrator(orchestrator) {}

std::size_t ChatGateway::CodePointCount(const std::string& text) {
    std::size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

void ChatGateway::Validate(const ChatRequest& request) {
    request.context.validate();

    const std::size_t length = CodePointCount(request.message);
    if (length == 0) {
        throw domain::ValidationError("Message must not be empty");
    }
    if (length > kMaxMessageLength) {
        throw domain::ValidationError("Message exceeds " + std::to_string(kMaxMessageLength) +
                                      " characters (" + std::to_string(length) + ")");
    }

    for (std::size_t i = 0; i < request.history.size(); ++i) {
        const std::size_t turnLength = CodePointCount(request.history[i].content);
        if (turnLength == 0 || turnLength > kMaxTurnLength) {
            throw domain::ValidationError("History turn " + std::to_string(i) + " must have 1 to " +
                                          std::to_string(kMaxTurnLength) + " characters");
        }
    }
}

ChatOutcome ChatGateway::send(const ChatRequest& request) const {
    try {
        Validate(request);

        const auto health = m_probe.probeHealth();
        if (health.status != EngineStatus::Connected) {
            throw domain::InferenceUnavailable("Ollama service is not available. " + health.error.value_or(""));
        }

        const auto result = m_orchestrator.orchestrate(request.message, request.context, request.history);

        ChatResponse response;
        response.response = result.text;
        response.timestampMs = NowMs();
        response.model = result.model;
        response.tokensUsed = result.tokensUsed;
        return response;
    } catch (const domain::ValidationError& e) {
        return Fail(FailureKind::Validation, e.what());
    } catch (const domain::InferenceUnavailable& e) {
        return Fail(FailureKind::Unavailable, e.what());
    } catch (const domain::InferenceError& e) {
        return Fail(FailureKind::Inference, std::string("Failed to generate response: ") + e.what());
    } catch (const domain::InternalAggregationError& e) {
        return Fail(FailureKind::Aggregation, e.what());
    } catch (const std::exception& e) {
        return Fail(FailureKind::Internal, e.what());
    }
}

} // namespace crowdpulse::application
