/**
 * @file SummaryJson.cpp
 * @brief Implementation of the summary and row serializers.
 */

#include "application/SummaryJson.hpp"

namespace crowdpulse::application {

using ordered_json = nlohmann::ordered_json;

ordered_json SummaryToJson(const domain::ContextSummary& summary) {
    ordered_json j;
    j["total_records"] = summary.totalRecords;
    j["total_users"] = summary.totalUsers;
    j["duration_distribution"] = {
        {"under_10min", summary.durationDistribution.under10Min},
        {"min_10_30", summary.durationDistribution.min10To30},
        {"over_30min", summary.durationDistribution.over30Min}
    };
    j["gender_distribution"] = {
        {"male_pct", summary.genderDistribution.malePct},
        {"female_pct", summary.genderDistribution.femalePct}
    };

    ordered_json ages = ordered_json::object();
    for (std::size_t i = 0; i < domain::kAgeBucketCount; ++i) {
        ages[domain::AgeDistribution::FieldName(i)] = summary.ageDistribution.pct[i];
    }
    j["age_distribution"] = ages;

    ordered_json top = ordered_json::array();
    for (const auto& loc : summary.topLocations) {
        top.push_back({
            {"lat", loc.lat},
            {"lon", loc.lng},
            {"total_users", loc.totalUsers},
            {"under_10min", loc.under10Min},
            {"10_30min", loc.min10To30},
            {"over_30min", loc.over30Min}
        });
    }
    j["top_locations"] = top;
    return j;
}

ordered_json RowToJson(const domain::ObservationRow& row) {
    ordered_json j;
    j["month"] = row.month;
    j["gx"] = row.gridX;
    j["gy"] = row.gridY;
    j["lat"] = row.lat;
    j["lng"] = row.lng;
    j["hour"] = row.hour;
    j["day_type"] = domain::DayTypeToLabel(row.dayType);
    j["avg_total_users"] = row.totalUsers;
    j["avg_users_under_10min"] = row.usersUnder10Min;
    j["avg_users_10_30min"] = row.users10To30Min;
    j["avg_users_over_30min"] = row.usersOver30Min;
    j["sex_1"] = row.sex1;
    j["sex_2"] = row.sex2;
    for (std::size_t i = 0; i < domain::kAgeBucketCount; ++i) {
        j[domain::AgeDistribution::FieldName(i)] = row.ages[i];
    }
    return j;
}

} // namespace crowdpulse::application
