#include "infrastructure/ObservationIndex.hpp"

namespace crowdpulse::infrastructure {

namespace {
const std::vector<domain::ObservationRow> kNoRows;
}

ObservationIndex::ObservationIndex(std::vector<domain::ObservationRow> rows)
    : m_rowCount(rows.size()) {
    for (auto& row : rows) {
        m_partitions[row.key()].push_back(std::move(row));
    }
}

const std::vector<domain::ObservationRow>& ObservationIndex::lookup(const domain::FilterKey& key) const {
    auto it = m_partitions.find(key);
    if (it == m_partitions.end()) {
        return kNoRows;
    }
    return it->second;
}

} // namespace crowdpulse::infrastructure
