/**
 * @file SummaryJson.hpp
 * @brief Machine-readable serialization of summaries and rows.
 */

#pragma once
#include <nlohmann/json.hpp>
#include "domain/ContextSummary.hpp"
#include "domain/ObservationRow.hpp"

namespace crowdpulse::application {

/**
 * @brief Serializes a summary with a fixed key order, so the same summary
 * always dumps to the same text.
 */
nlohmann::ordered_json SummaryToJson(const domain::ContextSummary& summary);

/** @brief Flat 23-field mapping of a row, keyed with the dataset column names. */
nlohmann::ordered_json RowToJson(const domain::ObservationRow& row);

} // namespace crowdpulse::application
