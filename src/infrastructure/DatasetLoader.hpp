/**
 * @file DatasetLoader.hpp
 * @brief Reads the crowd dataset CSV into observation rows.
 */

#pragma once
#include <cstddef>
#include <istream>
#include <string>
#include <vector>
#include "domain/ObservationRow.hpp"

namespace crowdpulse::infrastructure {

/**
 * @struct LoadResult
 * @brief Parsed rows plus the number of data lines that had to be skipped.
 */
struct LoadResult {
    std::vector<domain::ObservationRow> rows;
    std::size_t skippedLines = 0;
};

/**
 * @class DatasetLoader
 * @brief CSV parser for the dataset.
 *
 * The header must name month, gx, gy, lat, lng (or lon), hour and day_type.
 * Metric columns (avg_total_users, avg_users_*, sex_*, age_*) are optional; absent
 * columns and empty or non-numeric cells are stored as domain::kMissing.
 * Lines with an unusable key or coordinate are skipped.
 */
class DatasetLoader {
public:
    /** @throws ConfigError if the file cannot be opened or its header is unusable. */
    static LoadResult LoadFile(const std::string& path);

    /** @throws ConfigError if the header is missing or lacks a required column. */
    static LoadResult Parse(std::istream& in, const std::string& sourceName = "<stream>");

    /** @brief Splits one CSV line, honoring double-quoted fields. */
    static std::vector<std::string> SplitLine(const std::string& line);
};

} // namespace crowdpulse::infrastructure
