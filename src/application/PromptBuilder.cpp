/**
 * @file PromptBuilder.cpp
 * @brief Implementation of PromptBuilder.
 */

#include "application/PromptBuilder.hpp"
#include "application/SummaryJson.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <sstream>

namespace crowdpulse::application {

using infrastructure::PromptCatalog;

std::string PromptBuilder::build(const domain::ContextSummary& summary, const domain::FilterKey& key) const {
    std::stringstream ss;

    ss << PromptCatalog::GetAnalystRole() << "\n\n";

    ss << "## 當前數據上下文\n\n"
       << "### 篩選條件\n"
       << "- 月份: " << key.month << "\n"
       << "- 時段: " << key.hour << ":00\n"
       << "- 日期類型: " << domain::DayTypeToLabel(key.dayType) << "\n\n";

    ss << "### 數據摘要\n"
       << SummaryToJson(summary).dump(2) << "\n\n";

    if (summary.isEmpty()) {
        ss << PromptCatalog::GetEmptyDataInstruction() << "\n";
    }

    ss << PromptCatalog::GetFieldGuide() << "\n"
       << PromptCatalog::GetAnalysisRules() << "\n"
       << PromptCatalog::GetStyleRules() << "\n"
       << PromptCatalog::GetTopicPlaybook();

    return ss.str();
}

} // namespace crowdpulse::application
