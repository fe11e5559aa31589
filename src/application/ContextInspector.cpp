/**
 * @file ContextInspector.cpp
 * @brief Implementation of ContextInspector.
 */

#include "application/ContextInspector.hpp"
#include <algorithm>
#include <iterator>

namespace crowdpulse::application {

nlohmann::ordered_json ContextSnapshot::toJson() const {
    nlohmann::ordered_json j;
    j["metadata"] = {
        {"total_records", totalRecords},
        {"query", {
            {"month", query.month},
            {"hour", query.hour},
            {"day_type", domain::DayTypeToLabel(query.dayType)}
        }}
    };
    j["sample_data"] = sampleData;
    j["note"] = note ? nlohmann::ordered_json(*note) : nlohmann::ordered_json(nullptr);
    return j;
}

ContextInspector::ContextInspector(const ExportProjector& projector)
    : m_projector(projector) {}

ContextSnapshot ContextInspector::inspect(const domain::FilterKey& key) const {
    auto records = m_projector.project(key);

    ContextSnapshot snapshot;
    snapshot.query = key;
    snapshot.totalRecords = static_cast<int>(records.size());

    const std::size_t keep = std::min(records.size(), kSampleLimit);
    snapshot.sampleData.assign(std::make_move_iterator(records.begin()),
                               std::make_move_iterator(records.begin() + static_cast<std::ptrdiff_t>(keep)));
    if (records.size() > kSampleLimit) {
        snapshot.note = "Showing " + std::to_string(kSampleLimit) + " of " +
                        std::to_string(records.size()) + " records";
    }
    return snapshot;
}

} // namespace crowdpulse::application
