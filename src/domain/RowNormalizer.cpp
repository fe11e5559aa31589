/**
 * @file RowNormalizer.cpp
 * @brief Implementation of NormalizeRow.
 */

#include "domain/RowNormalizer.hpp"
#include "domain/Errors.hpp"
#include <cmath>
#include <string>

namespace crowdpulse::domain {

namespace {

[[noreturn]] void Reject(const FilterKey& key, const ObservationRow& row, const std::string& reason) {
    throw InternalAggregationError("Row (" + std::to_string(row.gridX) + "," + std::to_string(row.gridY) +
                                   ") under key " + key.toString() + ": " + reason);
}

void ZeroFill(double& value, const char* field, const FilterKey& key, const ObservationRow& row) {
    if (std::isnan(value)) {
        value = 0.0;
    } else if (std::isinf(value)) {
        Reject(key, row, std::string("infinite value in ") + field);
    } else if (value < 0.0) {
        Reject(key, row, std::string("negative value in ") + field);
    }
}

} // namespace

ObservationRow NormalizeRow(const ObservationRow& raw, const FilterKey& expected) {
    if (raw.key() != expected) {
        Reject(expected, raw, "row belongs to key " + raw.key().toString());
    }
    if (!std::isfinite(raw.lat) || !std::isfinite(raw.lng)) {
        Reject(expected, raw, "coordinates are not finite");
    }

    ObservationRow row = raw;
    ZeroFill(row.totalUsers, "total_users", expected, raw);
    ZeroFill(row.usersUnder10Min, "users_under_10min", expected, raw);
    ZeroFill(row.users10To30Min, "users_10_30min", expected, raw);
    ZeroFill(row.usersOver30Min, "users_over_30min", expected, raw);
    ZeroFill(row.sex1, "sex_1", expected, raw);
    ZeroFill(row.sex2, "sex_2", expected, raw);
    for (auto& age : row.ages) {
        ZeroFill(age, "age", expected, raw);
    }
    return row;
}

} // namespace crowdpulse::domain
