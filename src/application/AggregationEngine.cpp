/**
 * @file AggregationEngine.cpp
 * @brief Implementation of AggregationEngine.
 */

#include "application/AggregationEngine.hpp"
#include "domain/RowNormalizer.hpp"
#include <algorithm>
#include <numeric>

namespace crowdpulse::application {

using domain::ContextSummary;
using domain::ObservationRow;

namespace {

template <typename Field>
double WeightedShare(const std::vector<ObservationRow>& rows,
                     const std::vector<double>& weights,
                     double totalWeight,
                     Field field) {
    if (totalWeight <= 0.0) {
        return 0.0;
    }
    double acc = 0.0;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        acc += field(rows[i]) * weights[i];
    }
    return acc / totalWeight;
}

} // namespace

AggregationEngine::AggregationEngine(std::shared_ptr<const domain::DataCache> cache)
    : m_cache(std::move(cache)) {}

ContextSummary AggregationEngine::aggregate(const domain::FilterKey& key) const {
    key.validate();

    const auto& rawRows = m_cache->lookup(key);
    if (rawRows.empty()) {
        return ContextSummary::Empty();
    }

    std::vector<ObservationRow> rows;
    rows.reserve(rawRows.size());
    for (const auto& raw : rawRows) {
        rows.push_back(domain::NormalizeRow(raw, key));
    }
    return Summarize(rows);
}

ContextSummary AggregationEngine::Summarize(const std::vector<ObservationRow>& rows) {
    if (rows.empty()) {
        return ContextSummary::Empty();
    }

    ContextSummary summary;
    summary.totalRecords = static_cast<int>(rows.size());

    std::vector<double> weights;
    weights.reserve(rows.size());
    for (const auto& row : rows) {
        weights.push_back(row.totalUsers);
        summary.durationDistribution.under10Min += row.usersUnder10Min;
        summary.durationDistribution.min10To30 += row.users10To30Min;
        summary.durationDistribution.over30Min += row.usersOver30Min;
    }
    summary.totalUsers = std::accumulate(weights.begin(), weights.end(), 0.0);

    const double total = summary.totalUsers;
    summary.genderDistribution.malePct =
        WeightedShare(rows, weights, total, [](const ObservationRow& r) { return r.sex1; });
    summary.genderDistribution.femalePct =
        WeightedShare(rows, weights, total, [](const ObservationRow& r) { return r.sex2; });
    for (std::size_t bucket = 0; bucket < domain::kAgeBucketCount; ++bucket) {
        summary.ageDistribution.pct[bucket] =
            WeightedShare(rows, weights, total, [bucket](const ObservationRow& r) { return r.ages[bucket]; });
    }

    std::vector<std::size_t> order(rows.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&weights](std::size_t a, std::size_t b) {
        return weights[a] > weights[b];
    });

    const std::size_t topCount = std::min(ContextSummary::kTopLocationCount, rows.size());
    summary.topLocations.reserve(topCount);
    for (std::size_t i = 0; i < topCount; ++i) {
        const auto& row = rows[order[i]];
        domain::TopLocation loc;
        loc.lat = row.lat;
        loc.lng = row.lng;
        loc.totalUsers = row.totalUsers;
        loc.under10Min = row.usersUnder10Min;
        loc.min10To30 = row.users10To30Min;
        loc.over30Min = row.usersOver30Min;
        summary.topLocations.push_back(loc);
    }

    return summary;
}

} // namespace crowdpulse::application
