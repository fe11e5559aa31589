/**
 * @file RowNormalizer.hpp
 * @brief Single normalization pass applied to every row before it is aggregated or exported.
 */

#pragma once
#include "domain/ObservationRow.hpp"

namespace crowdpulse::domain {

/**
 * @brief Returns a copy of the row with every missing (NaN) metric replaced by 0.0.
 * @param raw Row as read from the data cache.
 * @param expected Key the row was looked up with; used for consistency checks and error context.
 * @throws InternalAggregationError if the coordinates are not finite, a metric is infinite or negative,
 *         or the row was filed under a different key.
 */
ObservationRow NormalizeRow(const ObservationRow& raw, const FilterKey& expected);

} // namespace crowdpulse::domain
