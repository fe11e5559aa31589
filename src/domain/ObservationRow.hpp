/**
 * @file ObservationRow.hpp
 * @brief One spatio-temporal record of the crowd dataset.
 */

#pragma once
#include <array>
#include <cstddef>
#include <limits>
#include "domain/FilterKey.hpp"

namespace crowdpulse::domain {

/** @brief Number of age buckets (age_1..age_9 plus age_other). */
constexpr std::size_t kAgeBucketCount = 10;

/** @brief Marker for a metric cell that was absent or unparsable in the source. */
constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

/**
 * @struct ObservationRow
 * @brief Per-location record: grid cell, position, visitor counts and demographic shares.
 *
 * Metric fields may hold kMissing until the row goes through NormalizeRow().
 * Coordinates are required and never missing.
 */
struct ObservationRow {
    int month = 0;
    int gridX = 0;
    int gridY = 0;
    double lat = 0.0;
    double lng = 0.0;
    int hour = 0;
    DayType dayType = DayType::Weekday;

    double totalUsers = 0.0;
    double usersUnder10Min = 0.0;
    double users10To30Min = 0.0;
    double usersOver30Min = 0.0;

    double sex1 = 0.0; ///< Male share (%).
    double sex2 = 0.0; ///< Female share (%).

    std::array<double, kAgeBucketCount> ages{}; ///< age_1..age_9, age_other (%).

    /** @brief Partition this row belongs to (not range-checked). */
    FilterKey key() const {
        FilterKey k;
        k.month = month;
        k.hour = hour;
        k.dayType = dayType;
        return k;
    }
};

} // namespace crowdpulse::domain
