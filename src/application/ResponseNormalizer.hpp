/**
 * @file ResponseNormalizer.hpp
 * @brief Collapses both engine reply shapes into one InferenceResult.
 */

#pragma once
#include <string>
#include "domain/InferenceEngine.hpp"

namespace crowdpulse::application {

/**
 * @brief Normalizes an engine reply.
 *
 * tokens_used = eval_count + prompt_eval_count, each counted as 0 when absent.
 * The model falls back to @p configuredModel when the reply does not name one.
 * @throws InferenceError if a mapping reply carries no message content.
 */
domain::InferenceResult NormalizeReply(const domain::EngineReply& reply, const std::string& configuredModel);

} // namespace crowdpulse::application
