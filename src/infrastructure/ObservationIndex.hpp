/**
 * @file ObservationIndex.hpp
 * @brief Immutable in-memory snapshot of the dataset, keyed by FilterKey.
 */

#pragma once
#include <cstddef>
#include <unordered_map>
#include <vector>
#include "domain/DataCache.hpp"

namespace crowdpulse::infrastructure {

/**
 * @class ObservationIndex
 * @brief Groups rows by partition once at construction; read-only afterwards.
 *
 * Rows keep their relative dataset order inside each partition.
 */
class ObservationIndex : public domain::DataCache {
public:
    explicit ObservationIndex(std::vector<domain::ObservationRow> rows);

    const std::vector<domain::ObservationRow>& lookup(const domain::FilterKey& key) const override;

    std::size_t rowCount() const { return m_rowCount; }
    std::size_t keyCount() const { return m_partitions.size(); }

private:
    std::unordered_map<domain::FilterKey, std::vector<domain::ObservationRow>, domain::FilterKeyHash> m_partitions;
    std::size_t m_rowCount = 0;
};

} // namespace crowdpulse::infrastructure
