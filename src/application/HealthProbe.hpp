/**
 * @file HealthProbe.hpp
 * @brief Reachability and model-availability check of the inference engine.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/InferenceEngine.hpp"

namespace crowdpulse::application {

/** @brief Connection state of the inference engine. */
enum class EngineStatus {
    Connected,    ///< Reachable and the configured model is available.
    Degraded,     ///< Reachable but the configured model is missing.
    Disconnected  ///< Model manifest could not be fetched.
};

std::string EngineStatusToString(EngineStatus status);

/**
 * @struct HealthReport
 * @brief Outcome of one probe.
 */
struct HealthReport {
    EngineStatus status = EngineStatus::Disconnected;
    bool modelLoaded = false;
    std::string model;
    std::vector<std::string> availableModels;
    std::optional<std::string> error;

    nlohmann::ordered_json toJson() const;
};

/**
 * @class HealthProbe
 * @brief Queries the model manifest; never lets a transport failure escape.
 */
class HealthProbe {
public:
    HealthProbe(std::shared_ptr<domain::InferenceEngine> engine, std::string model);

    HealthReport probeHealth() const;

private:
    std::shared_ptr<domain::InferenceEngine> m_engine;
    std::string m_model;
};

} // namespace crowdpulse::application
