/**
 * @file AggregationEngine.hpp
 * @brief Computes the ContextSummary of one dataset partition.
 */

#pragma once
#include <memory>
#include <vector>
#include "domain/ContextSummary.hpp"
#include "domain/DataCache.hpp"
#include "domain/FilterKey.hpp"

namespace crowdpulse::application {

/**
 * @class AggregationEngine
 * @brief Stateless reducer from observation rows to summary statistics.
 *
 * Every call reads the shared cache and builds a fresh summary; nothing is kept
 * between calls, so one instance serves concurrent requests.
 */
class AggregationEngine {
public:
    explicit AggregationEngine(std::shared_ptr<const domain::DataCache> cache);

    /**
     * @brief Summary of the rows filed under @p key.
     * @throws ValidationError if the key is out of range.
     * @throws InternalAggregationError if a row cannot be aggregated.
     * @return ContextSummary::Empty() when the partition has no rows.
     */
    domain::ContextSummary aggregate(const domain::FilterKey& key) const;

    /**
     * @brief Pure reduction over rows that already went through NormalizeRow().
     *
     * Weighted shares use total_users as the single weight vector:
     * sum(field_i * w_i) / sum(w_i), or 0 when the total weight is 0.
     * Top locations are ranked by total_users descending, ties keep row order.
     */
    static domain::ContextSummary Summarize(const std::vector<domain::ObservationRow>& rows);

private:
    std::shared_ptr<const domain::DataCache> m_cache;
};

} // namespace crowdpulse::application
