/**
 * @file ExportProjector.hpp
 * @brief Flattens the raw rows of a partition for inspection.
 */

#pragma once
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/DataCache.hpp"
#include "domain/FilterKey.hpp"

namespace crowdpulse::application {

/**
 * @class ExportProjector
 * @brief Returns every row of a partition as a plain field mapping, with no aggregation.
 *
 * Rows pass through the same zero-normalization as the aggregation path.
 * The full sequence is returned; callers slice it.
 */
class ExportProjector {
public:
    explicit ExportProjector(std::shared_ptr<const domain::DataCache> cache);

    /**
     * @brief All rows of @p key in dataset order, 23 fields each.
     * @throws ValidationError if the key is out of range.
     * @throws InternalAggregationError if a row fails normalization.
     */
    std::vector<nlohmann::ordered_json> project(const domain::FilterKey& key) const;

private:
    std::shared_ptr<const domain::DataCache> m_cache;
};

} // namespace crowdpulse::application
