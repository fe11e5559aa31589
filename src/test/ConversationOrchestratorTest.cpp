#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include "application/ConversationOrchestrator.hpp"
#include "application/ResponseNormalizer.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ObservationIndex.hpp"
#include "TestSupport.hpp"

using namespace crowdpulse;
using domain::ChatMessage;
using domain::DayType;
using domain::FilterKey;

namespace {

const FilterKey kKey = FilterKey::Make(202412, 8, DayType::Weekday);

std::vector<domain::ConversationTurn> MakeHistory(int n) {
    std::vector<domain::ConversationTurn> history;
    for (int i = 0; i < n; ++i) {
        domain::ConversationTurn turn;
        turn.role = (i % 2 == 0) ? ChatMessage::Role::User : ChatMessage::Role::Assistant;
        turn.content = "turn " + std::to_string(i);
        turn.timestampMs = 1734480123456LL + i;
        history.push_back(turn);
    }
    return history;
}

struct Fixture {
    std::shared_ptr<test::FakeInferenceEngine> engine = std::make_shared<test::FakeInferenceEngine>();
    application::AggregationEngine aggregation{
        std::make_shared<infrastructure::ObservationIndex>(
            std::vector<domain::ObservationRow>{test::MakeRow(kKey, 1, 1, 42.0)})};
    application::ConversationOrchestrator orchestrator{aggregation, engine, "qwen2.5:7b"};
};

void TestSingleTurn() {
    Fixture f;
    auto result = f.orchestrator.orchestrate("哪個時段最繁忙？", kKey, {});

    assert(f.engine->chatCalls == 1);
    assert(f.engine->lastModel == "qwen2.5:7b");
    // system + new user turn; no history
    assert(f.engine->lastMessages.size() == 2);
    assert(f.engine->lastMessages[0].role == ChatMessage::Role::System);
    assert(f.engine->lastMessages[0].content.find("\"total_records\": 1") != std::string::npos);
    assert(f.engine->lastMessages[1].role == ChatMessage::Role::User);
    assert(f.engine->lastMessages[1].content == "哪個時段最繁忙？");

    assert(result.text == "fake answer");
    assert(result.model == "qwen2.5:7b");
    assert(result.tokensUsed == 42);
    std::cout << "[PASS] Single turn dispatch." << std::endl;
}

void TestOneHistoryTurn() {
    Fixture f;
    f.orchestrator.orchestrate("哪個時段最繁忙？", kKey, MakeHistory(1));
    assert(f.engine->lastMessages.size() == 3);
    assert(f.engine->lastMessages[1].content == "turn 0");
    std::cout << "[PASS] Three messages with one history turn." << std::endl;
}

void TestHistoryTruncation() {
    Fixture f;
    auto history = MakeHistory(35);
    f.orchestrator.orchestrate("latest question", kKey, history);

    const auto& sent = f.engine->lastMessages;
    assert(sent.size() == 1 + application::ConversationOrchestrator::kHistoryLimit + 1);
    assert(sent.size() == 22);
    // Oldest 15 dropped, order preserved
    assert(sent[1].content == "turn 15");
    assert(sent[20].content == "turn 34");
    assert(sent[1].role == ChatMessage::Role::Assistant);
    assert(sent.back().role == ChatMessage::Role::User);
    assert(sent.back().content == "latest question");

    auto exact = application::ConversationOrchestrator::AssembleMessages("sys", MakeHistory(20), "q");
    assert(exact.size() == 22);
    assert(exact[1].content == "turn 0");

    auto shortHistory = application::ConversationOrchestrator::AssembleMessages("sys", MakeHistory(4), "q");
    assert(shortHistory.size() == 6);
    assert(shortHistory[0].content == "sys");
    std::cout << "[PASS] History capped at the 20 most recent turns." << std::endl;
}

void TestReplyShapes() {
    domain::StructuredReply noCounters;
    noCounters.text = "a";
    noCounters.model = "m";
    auto r1 = application::NormalizeReply(noCounters, "cfg");
    assert(r1.tokensUsed == 0 && r1.model == "m" && r1.text == "a");

    domain::MappingReply mapping = {
        {"model", "qwen2.5:7b"},
        {"message", {{"role", "assistant"}, {"content", "根據統計"}}},
        {"eval_count", 7},
        {"prompt_eval_count", 100}
    };
    auto r2 = application::NormalizeReply(mapping, "cfg");
    assert(r2.text == "根據統計" && r2.tokensUsed == 107 && r2.model == "qwen2.5:7b");

    domain::MappingReply bare = {{"message", {{"content", "ok"}}}};
    auto r3 = application::NormalizeReply(bare, "cfg");
    assert(r3.tokensUsed == 0 && r3.model == "cfg");

    bool malformed = false;
    try {
        application::NormalizeReply(domain::MappingReply{{"done", true}}, "cfg");
    } catch (const domain::InferenceError&) {
        malformed = true;
    }
    assert(malformed);

    Fixture f;
    f.engine->reply = domain::EngineReply(std::in_place_type<domain::MappingReply>, mapping);
    auto viaEngine = f.orchestrator.orchestrate("q", kKey, {});
    assert(viaEngine.tokensUsed == 107);
    std::cout << "[PASS] Both reply shapes normalize." << std::endl;
}

void TestFailurePropagation() {
    Fixture f;
    f.engine->chatFails = true;
    try {
        f.orchestrator.orchestrate("q", kKey, {});
        assert(false && "dispatch failure must propagate");
    } catch (const domain::InferenceError& e) {
        assert(std::string(e.what()).find("http://fake-engine:11434") != std::string::npos);
    }
    assert(f.engine->chatCalls == 1); // no retry

    Fixture g;
    g.engine->chatThrowsForeign = true;
    try {
        g.orchestrator.orchestrate("q", kKey, {});
        assert(false && "foreign failures are converted");
    } catch (const domain::InferenceError& e) {
        const std::string what = e.what();
        assert(what.find("socket closed") != std::string::npos);
        assert(what.find("http://fake-engine:11434") != std::string::npos);
    }
    assert(g.engine->chatCalls == 1);

    // Invalid key never reaches the engine
    Fixture h;
    FilterKey bad;
    bad.month = 13;
    bool rejected = false;
    try {
        h.orchestrator.orchestrate("q", bad, {});
    } catch (const domain::ValidationError&) {
        rejected = true;
    }
    assert(rejected && h.engine->chatCalls == 0);
    std::cout << "[PASS] Failures propagate after a single attempt." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConversationOrchestrator Test..." << std::endl;
    TestSingleTurn();
    TestOneHistoryTurn();
    TestHistoryTruncation();
    TestReplyShapes();
    TestFailurePropagation();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
