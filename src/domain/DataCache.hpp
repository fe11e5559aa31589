/**
 * @file DataCache.hpp
 * @brief Read interface of the keyed observation store.
 */

#pragma once
#include <vector>
#include "domain/FilterKey.hpp"
#include "domain/ObservationRow.hpp"

namespace crowdpulse::domain {

/**
 * @class DataCache
 * @brief Immutable keyed store of observation rows.
 *
 * Implementations are built once before serving and never mutated afterwards,
 * so lookup() may be called concurrently without synchronization.
 */
class DataCache {
public:
    virtual ~DataCache() = default;

    /**
     * @brief Rows of one partition, in dataset order.
     * @return Empty sequence when the key has no data.
     */
    virtual const std::vector<ObservationRow>& lookup(const FilterKey& key) const = 0;
};

} // namespace crowdpulse::domain
