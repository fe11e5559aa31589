#include <cassert>
#include <iostream>
#include <string>
#include "application/AggregationEngine.hpp"
#include "application/PromptBuilder.hpp"
#include "application/SummaryJson.hpp"
#include "TestSupport.hpp"

using namespace crowdpulse;
using domain::DayType;
using domain::FilterKey;

namespace {

bool Contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

const char* const kEmptyMarker = "當前條件下無可用數據";

} // namespace

int main() {
    std::cout << "[Test] Starting PromptBuilder Test..." << std::endl;

    const auto key = FilterKey::Make(202412, 8, DayType::Weekday);
    auto summary = application::AggregationEngine::Summarize({
        test::MakeRow(key, 1, 1, 120.5),
        test::MakeRow(key, 2, 2, 60.0)
    });

    application::PromptBuilder builder;
    const std::string prompt = builder.build(summary, key);

    // Deterministic
    assert(prompt == builder.build(summary, key));
    assert(prompt == application::PromptBuilder().build(summary, key));

    // Filter values and serialized summary
    assert(Contains(prompt, "月份: 202412"));
    assert(Contains(prompt, "時段: 8:00"));
    assert(Contains(prompt, "日期類型: 平日"));
    assert(Contains(prompt, application::SummaryToJson(summary).dump(2)));
    assert(Contains(prompt, "\"total_users\": 180.5"));
    assert(Contains(prompt, "\"top_locations\""));

    // Fixed rule blocks, no empty-data branch
    assert(Contains(prompt, "## 分析規則"));
    assert(Contains(prompt, "## 回答風格"));
    assert(Contains(prompt, "經緯度座標"));
    assert(!Contains(prompt, kEmptyMarker));
    std::cout << "[PASS] Prompt with data." << std::endl;

    // Empty partition switches on the no-data instruction
    const auto weekend = FilterKey::Make(202412, 23, DayType::Weekend);
    const std::string emptyPrompt = builder.build(domain::ContextSummary::Empty(), weekend);
    assert(Contains(emptyPrompt, kEmptyMarker));
    assert(Contains(emptyPrompt, "\"total_records\": 0"));
    assert(Contains(emptyPrompt, "日期類型: 假日"));
    assert(Contains(emptyPrompt, "時段: 23:00"));
    assert(emptyPrompt != prompt);
    std::cout << "[PASS] Prompt without data." << std::endl;

    return 0;
}
