#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "application/AggregationEngine.hpp"
#include "application/ConversationOrchestrator.hpp"
#include "application/ExportProjector.hpp"
#include "application/SummaryJson.hpp"
#include "infrastructure/ObservationIndex.hpp"
#include "TestSupport.hpp"

using namespace crowdpulse;
using domain::DayType;
using domain::FilterKey;

// Engine shared by every worker; keeps no per-call state besides an atomic counter.
class SharedEngine : public domain::InferenceEngine {
public:
    std::atomic<int> chatCalls{0};

    std::vector<std::string> listModels() override { return {"qwen2.5:7b"}; }

    domain::EngineReply chat(const std::string& model, const std::vector<domain::ChatMessage>& messages) override {
        // Simulate network delay
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        chatCalls++;
        return domain::StructuredReply{"answer with " + std::to_string(messages.size()) + " messages", model, 10, 20};
    }

    std::string endpoint() const override { return "http://shared-engine:11434"; }
};

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    const FilterKey busy = FilterKey::Make(202412, 8, DayType::Weekday);
    const FilterKey quiet = FilterKey::Make(202412, 3, DayType::Weekend);

    std::vector<domain::ObservationRow> rows;
    for (int i = 0; i < 200; ++i) {
        auto row = test::MakeRow(busy, i % 20, i / 20, 10.0 + (i * 37) % 113);
        if (i % 7 == 0) row.sex2 = domain::kMissing;
        rows.push_back(row);
    }
    rows.push_back(test::MakeRow(quiet, 1, 1, 3.0));

    auto index = std::make_shared<const infrastructure::ObservationIndex>(std::move(rows));
    auto engine = std::make_shared<SharedEngine>();
    application::AggregationEngine aggregation(index);
    application::ExportProjector projector(index);
    application::ConversationOrchestrator orchestrator(aggregation, engine, "qwen2.5:7b");

    const std::string expectedBusy = application::SummaryToJson(aggregation.aggregate(busy)).dump();
    const std::string expectedQuiet = application::SummaryToJson(aggregation.aggregate(quiet)).dump();
    const std::size_t expectedExport = projector.project(busy).size();
    assert(expectedExport == 200);

    const int NUM_THREADS = 16;
    const int ROUNDS = 10;
    std::vector<std::thread> threads;
    std::atomic<int> mismatches{0};
    std::atomic<int> completed{0};

    std::cout << "[Test] Spawning " << NUM_THREADS << " reader threads..." << std::endl;

    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t]() {
            for (int r = 0; r < ROUNDS; ++r) {
                const bool useBusy = (t + r) % 2 == 0;
                const FilterKey& key = useBusy ? busy : quiet;

                auto summary = application::SummaryToJson(aggregation.aggregate(key)).dump();
                if (summary != (useBusy ? expectedBusy : expectedQuiet)) mismatches++;

                if (projector.project(busy).size() != expectedExport) mismatches++;
                if (index->lookup(quiet).size() != 1) mismatches++;

                auto result = orchestrator.orchestrate("message " + std::to_string(t), key, {});
                if (result.text != "answer with 2 messages" || result.tokensUsed != 30) mismatches++;
            }
            completed++;
        });
    }

    for (auto& thread : threads) {
        if (thread.joinable()) thread.join();
    }

    std::cout << "[Test] Threads completed: " << completed.load() << ", engine calls: " << engine->chatCalls.load() << std::endl;
    assert(completed == NUM_THREADS);
    assert(mismatches == 0);
    assert(engine->chatCalls == NUM_THREADS * ROUNDS);

    std::cout << "[PASS] Concurrent reads return identical results." << std::endl;
    return 0;
}
