/**
 * @file DatasetLoader.cpp
 * @brief Implementation of DatasetLoader.
 */

#include "infrastructure/DatasetLoader.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "domain/Errors.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <optional>

namespace crowdpulse::infrastructure {

namespace {

constexpr int kNoColumn = -1;

std::string Trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::optional<double> ParseNumber(const std::string& cell) {
    std::string text = Trim(cell);
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) return std::nullopt;
    if (std::isnan(value)) return std::nullopt;
    return value;
}

std::optional<double> ParseFinite(const std::string& cell) {
    auto value = ParseNumber(cell);
    if (!value || !std::isfinite(*value)) return std::nullopt;
    return value;
}

std::optional<int> ParseInteger(const std::string& cell) {
    auto value = ParseFinite(cell);
    if (!value || std::floor(*value) != *value) return std::nullopt;
    if (*value < static_cast<double>(std::numeric_limits<int>::min()) ||
        *value > static_cast<double>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

struct ColumnMap {
    std::map<std::string, int> index;

    int find(const std::string& name) const {
        auto it = index.find(name);
        return it == index.end() ? kNoColumn : it->second;
    }

    int require(const std::string& name, const std::string& sourceName) const {
        int col = find(name);
        if (col == kNoColumn) {
            throw ConfigError(sourceName + ": missing required column '" + name + "'");
        }
        return col;
    }
};

const std::string& Cell(const std::vector<std::string>& cells, int col) {
    static const std::string kEmpty;
    if (col == kNoColumn || col >= static_cast<int>(cells.size())) return kEmpty;
    return cells[static_cast<std::size_t>(col)];
}

double Metric(const std::vector<std::string>& cells, int col) {
    return ParseNumber(Cell(cells, col)).value_or(domain::kMissing);
}

} // namespace

std::vector<std::string> DatasetLoader::SplitLine(const std::string& line) {
    std::vector<std::string> cells;
    std::string current;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                current.push_back('"');
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            cells.push_back(current);
            current.clear();
        } else if (c != '\r') {
            current.push_back(c);
        }
    }
    cells.push_back(current);
    return cells;
}

LoadResult DatasetLoader::LoadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("Cannot open dataset " + path);
    }
    return Parse(in, path);
}

LoadResult DatasetLoader::Parse(std::istream& in, const std::string& sourceName) {
    std::string line;
    if (!std::getline(in, line)) {
        throw ConfigError(sourceName + ": empty dataset, header row expected");
    }
    if (line.rfind("\xEF\xBB\xBF", 0) == 0) {
        line.erase(0, 3);
    }

    ColumnMap columns;
    auto header = SplitLine(line);
    for (std::size_t i = 0; i < header.size(); ++i) {
        columns.index[Trim(header[i])] = static_cast<int>(i);
    }

    const int colMonth = columns.require("month", sourceName);
    const int colGx = columns.require("gx", sourceName);
    const int colGy = columns.require("gy", sourceName);
    const int colLat = columns.require("lat", sourceName);
    const int colLng = columns.find("lng") != kNoColumn ? columns.find("lng") : columns.require("lon", sourceName);
    const int colHour = columns.require("hour", sourceName);
    const int colDayType = columns.require("day_type", sourceName);

    const int colTotal = columns.find("avg_total_users");
    const int colUnder10 = columns.find("avg_users_under_10min");
    const int col10To30 = columns.find("avg_users_10_30min");
    const int colOver30 = columns.find("avg_users_over_30min");
    const int colSex1 = columns.find("sex_1");
    const int colSex2 = columns.find("sex_2");
    std::vector<int> colAges;
    for (std::size_t i = 0; i < domain::kAgeBucketCount; ++i) {
        std::string name = (i + 1 < domain::kAgeBucketCount) ? "age_" + std::to_string(i + 1) : "age_other";
        colAges.push_back(columns.find(name));
    }

    LoadResult result;
    std::size_t lineNumber = 1;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (Trim(line).empty()) continue;

        auto cells = SplitLine(line);
        auto month = ParseInteger(Cell(cells, colMonth));
        auto hour = ParseInteger(Cell(cells, colHour));
        auto gx = ParseInteger(Cell(cells, colGx));
        auto gy = ParseInteger(Cell(cells, colGy));
        auto lat = ParseFinite(Cell(cells, colLat));
        auto lng = ParseFinite(Cell(cells, colLng));
        if (!month || !hour || !gx || !gy || !lat || !lng) {
            std::cerr << "[DatasetLoader] " << sourceName << ":" << lineNumber
                      << ": unusable key or coordinate, line skipped" << std::endl;
            ++result.skippedLines;
            continue;
        }

        domain::ObservationRow row;
        try {
            row.dayType = domain::ParseDayType(Cell(cells, colDayType));
        } catch (const domain::ValidationError& e) {
            std::cerr << "[DatasetLoader] " << sourceName << ":" << lineNumber << ": " << e.what() << std::endl;
            ++result.skippedLines;
            continue;
        }

        row.month = *month;
        row.hour = *hour;
        row.gridX = *gx;
        row.gridY = *gy;
        row.lat = *lat;
        row.lng = *lng;
        row.totalUsers = Metric(cells, colTotal);
        row.usersUnder10Min = Metric(cells, colUnder10);
        row.users10To30Min = Metric(cells, col10To30);
        row.usersOver30Min = Metric(cells, colOver30);
        row.sex1 = Metric(cells, colSex1);
        row.sex2 = Metric(cells, colSex2);
        for (std::size_t i = 0; i < domain::kAgeBucketCount; ++i) {
            row.ages[i] = Metric(cells, colAges[i]);
        }
        result.rows.push_back(row);
    }

    std::cout << "[DatasetLoader] " << sourceName << ": " << result.rows.size() << " rows loaded, "
              << result.skippedLines << " skipped" << std::endl;
    return result;
}

} // namespace crowdpulse::infrastructure
