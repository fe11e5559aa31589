/**
 * @file HealthProbe.cpp
 * @brief Implementation of HealthProbe.
 */

#include "application/HealthProbe.hpp"
#include <algorithm>
#include <iostream>

namespace crowdpulse::application {

std::string EngineStatusToString(EngineStatus status) {
    switch (status) {
        case EngineStatus::Connected: return "connected";
        case EngineStatus::Degraded: return "degraded";
        case EngineStatus::Disconnected: return "disconnected";
    }
    return "disconnected";
}

nlohmann::ordered_json HealthReport::toJson() const {
    nlohmann::ordered_json j;
    j["status"] = EngineStatusToString(status);
    j["model"] = model;
    j["model_loaded"] = modelLoaded;
    j["available_models"] = availableModels;
    j["error"] = error ? nlohmann::ordered_json(*error) : nlohmann::ordered_json(nullptr);
    return j;
}

HealthProbe::HealthProbe(std::shared_ptr<domain::InferenceEngine> engine, std::string model)
    : m_engine(std::move(engine)), m_model(std::move(model)) {}

HealthReport HealthProbe::probeHealth() const {
    HealthReport report;
    report.model = m_model;

    try {
        report.availableModels = m_engine->listModels();
    } catch (const std::exception& e) {
        std::cerr << "[HealthProbe] Manifest query failed: " << e.what() << std::endl;
        report.status = EngineStatus::Disconnected;
        report.modelLoaded = false;
        report.availableModels.clear();
        report.error = "Cannot connect to Ollama at " + m_engine->endpoint() + ": " + e.what();
        return report;
    }

    const auto& models = report.availableModels;
    report.modelLoaded = std::find(models.begin(), models.end(), m_model) != models.end();
    if (report.modelLoaded) {
        report.status = EngineStatus::Connected;
    } else {
        report.status = EngineStatus::Degraded;
        report.error = "Model " + m_model + " not found. Run: ollama pull " + m_model;
    }
    return report;
}

} // namespace crowdpulse::application
