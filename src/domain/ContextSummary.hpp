/**
 * @file ContextSummary.hpp
 * @brief Aggregate statistics derived from the rows of one FilterKey.
 */

#pragma once
#include <array>
#include <string>
#include <vector>
#include "domain/ObservationRow.hpp"

namespace crowdpulse::domain {

/** @brief Visitor totals per dwell-time bucket (absolute counts, not shares). */
struct DurationDistribution {
    double under10Min = 0.0;
    double min10To30 = 0.0;
    double over30Min = 0.0;

    double sum() const { return under10Min + min10To30 + over30Min; }
};

/** @brief Weighted gender shares (%). */
struct GenderDistribution {
    double malePct = 0.0;
    double femalePct = 0.0;
};

/** @brief Weighted age shares (%), age_1..age_9 then age_other. */
struct AgeDistribution {
    std::array<double, kAgeBucketCount> pct{};

    double sum() const {
        double total = 0.0;
        for (double v : pct) total += v;
        return total;
    }

    /** @brief Field name of a bucket ("age_1" .. "age_9", "age_other"). */
    static std::string FieldName(std::size_t index) {
        if (index + 1 >= kAgeBucketCount) return "age_other";
        return "age_" + std::to_string(index + 1);
    }
};

/** @brief One of the busiest locations of the partition. */
struct TopLocation {
    double lat = 0.0;
    double lng = 0.0;
    double totalUsers = 0.0;
    double under10Min = 0.0;
    double min10To30 = 0.0;
    double over30Min = 0.0;
};

/**
 * @struct ContextSummary
 * @brief Immutable value computed fresh for every request.
 */
struct ContextSummary {
    static constexpr std::size_t kTopLocationCount = 5;

    int totalRecords = 0;
    double totalUsers = 0.0;
    DurationDistribution durationDistribution;
    GenderDistribution genderDistribution;
    AgeDistribution ageDistribution;
    std::vector<TopLocation> topLocations; ///< Busiest first, at most kTopLocationCount.

    /** @brief Canonical summary of an empty partition: every figure is 0. */
    static ContextSummary Empty() { return ContextSummary{}; }

    bool isEmpty() const { return totalRecords == 0; }
};

} // namespace crowdpulse::domain
