/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the fixed blocks of the analyst system prompt.
 */

#pragma once

#include <string>

namespace crowdpulse::infrastructure {

class PromptCatalog {
public:
    /** @brief Opening statement describing the assistant's role. */
    static std::string GetAnalystRole();

    /** @brief Meaning of every field of the serialized summary. */
    static std::string GetFieldGuide();

    /** @brief Rules restricting answers to summary-derived figures. */
    static std::string GetAnalysisRules();

    /** @brief Tone and citation rules. */
    static std::string GetStyleRules();

    /** @brief How to answer the recurring question types. */
    static std::string GetTopicPlaybook();

    /** @brief Instruction used when the current filter has no data. */
    static std::string GetEmptyDataInstruction();
};

} // namespace crowdpulse::infrastructure
