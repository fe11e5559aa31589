/**
 * @file ResponseNormalizer.cpp
 * @brief Implementation of NormalizeReply.
 */

#include "application/ResponseNormalizer.hpp"
#include "domain/Errors.hpp"
#include <type_traits>

namespace crowdpulse::application {

namespace {

long long CounterOrZero(const nlohmann::json& body, const char* field) {
    auto it = body.find(field);
    if (it == body.end() || !it->is_number()) {
        return 0;
    }
    return it->get<long long>();
}

} // namespace

domain::InferenceResult NormalizeReply(const domain::EngineReply& reply, const std::string& configuredModel) {
    domain::InferenceResult result;

    std::visit([&](auto&& r) {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, domain::StructuredReply>) {
            result.text = r.text;
            result.model = r.model;
            result.tokensUsed = r.evalCount.value_or(0) + r.promptEvalCount.value_or(0);
        } else if constexpr (std::is_same_v<T, domain::MappingReply>) {
            if (!r.is_object() || !r.contains("message") || !r["message"].is_object() ||
                !r["message"].contains("content") || !r["message"]["content"].is_string()) {
                throw domain::InferenceError("Malformed chat reply: missing message.content");
            }
            result.text = r["message"]["content"].template get<std::string>();
            if (r.contains("model") && r["model"].is_string()) {
                result.model = r["model"].template get<std::string>();
            }
            result.tokensUsed = CounterOrZero(r, "eval_count") + CounterOrZero(r, "prompt_eval_count");
        }
    }, reply);

    if (result.model.empty()) {
        result.model = configuredModel;
    }
    return result;
}

} // namespace crowdpulse::application
