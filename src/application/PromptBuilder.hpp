/**
 * @file PromptBuilder.hpp
 * @brief Renders the system instruction that grounds the conversation on a summary.
 */

#pragma once
#include <string>
#include "domain/ContextSummary.hpp"
#include "domain/FilterKey.hpp"

namespace crowdpulse::application {

/**
 * @class PromptBuilder
 * @brief Pure function object: same summary and key always yield the same text.
 */
class PromptBuilder {
public:
    /**
     * @brief Builds the instruction block.
     *
     * Sections, in order: role, filter values, serialized summary, empty-data
     * instruction (only when total_records is 0), field guide, analysis rules,
     * style rules, topic playbook.
     */
    std::string build(const domain::ContextSummary& summary, const domain::FilterKey& key) const;
};

} // namespace crowdpulse::application
