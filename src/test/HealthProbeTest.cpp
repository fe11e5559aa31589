#include <cassert>
#include <iostream>
#include <memory>
#include "application/HealthProbe.hpp"
#include "infrastructure/OllamaAdapter.hpp"
#include "TestSupport.hpp"

using namespace crowdpulse;
using application::EngineStatus;

int main() {
    std::cout << "[Test] Starting HealthProbe Test..." << std::endl;

    auto engine = std::make_shared<test::FakeInferenceEngine>();
    engine->models = {"llama3:8b", "qwen2.5:7b"};

    application::HealthProbe probe(engine, "qwen2.5:7b");
    auto connected = probe.probeHealth();
    assert(connected.status == EngineStatus::Connected);
    assert(connected.modelLoaded);
    assert(!connected.error);
    assert(connected.availableModels.size() == 2);
    assert(connected.toJson()["status"] == "connected");
    std::cout << "[PASS] Connected." << std::endl;

    // Prefix matches do not count as loaded
    engine->models = {"qwen2.5:14b", "llama3:8b"};
    auto degraded = probe.probeHealth();
    assert(degraded.status == EngineStatus::Degraded);
    assert(!degraded.modelLoaded);
    assert(degraded.error && *degraded.error == "Model qwen2.5:7b not found. Run: ollama pull qwen2.5:7b");
    std::cout << "[PASS] Degraded." << std::endl;

    engine->manifestFails = true;
    auto disconnected = probe.probeHealth();
    assert(disconnected.status == EngineStatus::Disconnected);
    assert(!disconnected.modelLoaded);
    assert(disconnected.availableModels.empty());
    assert(disconnected.error);
    assert(disconnected.error->find("http://fake-engine:11434") != std::string::npos);
    assert(disconnected.toJson()["model_loaded"] == false);
    std::cout << "[PASS] Disconnected (fake transport)." << std::endl;

    // Real HTTP client against a port nothing listens on
    infrastructure::OllamaClient client("127.0.0.1", 1, 2, 2);
    auto unreachable = std::make_shared<infrastructure::OllamaAdapter>(client);
    application::HealthProbe realProbe(unreachable, "qwen2.5:7b");
    auto report = realProbe.probeHealth();
    assert(report.status == EngineStatus::Disconnected);
    assert(!report.modelLoaded);
    assert(report.error && report.error->find("Cannot connect to Ollama at http://127.0.0.1:1") == 0);
    std::cout << "[PASS] Disconnected (unreachable engine)." << std::endl;

    return 0;
}
