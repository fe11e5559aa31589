/**
 * @file AppServices.hpp
 * @brief Container for the shared service instances, built once per process.
 */

#pragma once

#include <memory>
#include "application/AggregationEngine.hpp"
#include "application/ChatGateway.hpp"
#include "application/ContextInspector.hpp"
#include "application/ConversationOrchestrator.hpp"
#include "application/ExportProjector.hpp"
#include "application/HealthProbe.hpp"
#include "application/PromptBuilder.hpp"
#include "domain/DataCache.hpp"
#include "domain/InferenceEngine.hpp"

namespace crowdpulse::application {

/**
 * @struct AppServices
 * @brief Explicitly injected services; members are declared dependencies-first
 *        so that references held by later members stay valid during teardown.
 */
struct AppServices {
    std::shared_ptr<const domain::DataCache> dataCache;
    std::shared_ptr<domain::InferenceEngine> inferenceEngine;
    std::unique_ptr<AggregationEngine> aggregationEngine;
    std::unique_ptr<ExportProjector> exportProjector;
    std::unique_ptr<ContextInspector> contextInspector;
    std::unique_ptr<PromptBuilder> promptBuilder;
    std::unique_ptr<HealthProbe> healthProbe;
    std::unique_ptr<ConversationOrchestrator> orchestrator;
    std::unique_ptr<ChatGateway> chatGateway;
};

/** @brief Wires every service on top of an existing cache and engine. */
AppServices BuildAppServices(std::shared_ptr<const domain::DataCache> cache,
                             std::shared_ptr<domain::InferenceEngine> engine,
                             const std::string& model);

} // namespace crowdpulse::application
