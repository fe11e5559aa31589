/**
 * @file AppServices.cpp
 * @brief Service wiring.
 */

#include "application/AppServices.hpp"

namespace crowdpulse::application {

AppServices BuildAppServices(std::shared_ptr<const domain::DataCache> cache,
                             std::shared_ptr<domain::InferenceEngine> engine,
                             const std::string& model) {
    AppServices services;
    services.dataCache = std::move(cache);
    services.inferenceEngine = std::move(engine);
    services.aggregationEngine = std::make_unique<AggregationEngine>(services.dataCache);
    services.exportProjector = std::make_unique<ExportProjector>(services.dataCache);
    services.contextInspector = std::make_unique<ContextInspector>(*services.exportProjector);
    services.promptBuilder = std::make_unique<PromptBuilder>();
    services.healthProbe = std::make_unique<HealthProbe>(services.inferenceEngine, model);
    services.orchestrator = std::make_unique<ConversationOrchestrator>(
        *services.aggregationEngine, services.inferenceEngine, model);
    services.chatGateway = std::make_unique<ChatGateway>(*services.healthProbe, *services.orchestrator);
    return services;
}

} // namespace crowdpulse::application
