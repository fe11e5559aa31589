/**
 * @file ContextInspector.hpp
 * @brief Debug view of the data a chat request would be grounded on.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/ExportProjector.hpp"

namespace crowdpulse::application {

/**
 * @struct ContextSnapshot
 * @brief Record count, echoed query and a bounded sample of projected rows.
 */
struct ContextSnapshot {
    int totalRecords = 0;
    domain::FilterKey query;
    std::vector<nlohmann::ordered_json> sampleData;
    std::optional<std::string> note; ///< Set when the sample was truncated.

    nlohmann::ordered_json toJson() const;
};

/**
 * @class ContextInspector
 * @brief Caller of ExportProjector that enforces the sample cap.
 */
class ContextInspector {
public:
    static constexpr std::size_t kSampleLimit = 50;

    explicit ContextInspector(const ExportProjector& projector);

    /** @throws ValidationError if the key is out of range. */
    ContextSnapshot inspect(const domain::FilterKey& key) const;

private:
    const ExportProjector& m_projector;
};

} // namespace crowdpulse::application
