/**
 * @file ExportProjector.cpp
 * @brief Implementation of ExportProjector.
 */

#include "application/ExportProjector.hpp"
#include "application/SummaryJson.hpp"
#include "domain/RowNormalizer.hpp"

namespace crowdpulse::application {

ExportProjector::ExportProjector(std::shared_ptr<const domain::DataCache> cache)
    : m_cache(std::move(cache)) {}

std::vector<nlohmann::ordered_json> ExportProjector::project(const domain::FilterKey& key) const {
    key.validate();

    const auto& rows = m_cache->lookup(key);
    std::vector<nlohmann::ordered_json> records;
    records.reserve(rows.size());
    for (const auto& raw : rows) {
        records.push_back(RowToJson(domain::NormalizeRow(raw, key)));
    }
    return records;
}

} // namespace crowdpulse::application
