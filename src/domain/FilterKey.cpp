/**
 * @file FilterKey.cpp
 * @brief Validation and label normalization for FilterKey.
 */

#include "domain/FilterKey.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace crowdpulse::domain {

namespace {

const char* const kWeekdayLabel = "平日";
const char* const kWeekendLabel = "假日";

std::string Trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string ToLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

} // namespace

std::string DayTypeToString(DayType type) {
    switch (type) {
        case DayType::Weekday: return "weekday";
        case DayType::Weekend: return "weekend";
    }
    return "weekday";
}

std::string DayTypeToLabel(DayType type) {
    switch (type) {
        case DayType::Weekday: return kWeekdayLabel;
        case DayType::Weekend: return kWeekendLabel;
    }
    return kWeekdayLabel;
}

DayType ParseDayType(const std::string& label) {
    std::string token = Trim(label);
    if (token == kWeekdayLabel) return DayType::Weekday;
    if (token == kWeekendLabel) return DayType::Weekend;

    std::string lower = ToLowerAscii(token);
    if (lower == "weekday") return DayType::Weekday;
    if (lower == "weekend") return DayType::Weekend;

    throw ValidationError("Unknown day type: '" + label + "' (expected 平日, 假日, weekday or weekend)");
}

FilterKey FilterKey::Make(int month, int hour, DayType dayType) {
    FilterKey key;
    key.month = month;
    key.hour = hour;
    key.dayType = dayType;
    key.validate();
    return key;
}

FilterKey FilterKey::Make(int month, int hour, const std::string& dayTypeLabel) {
    return Make(month, hour, ParseDayType(dayTypeLabel));
}

void FilterKey::validate() const {
    if (month < kMinMonth || month > kMaxMonth) {
        throw ValidationError("Month must be in YYYYMM format between " + std::to_string(kMinMonth) +
                              " and " + std::to_string(kMaxMonth) + ", got " + std::to_string(month));
    }
    if (hour < 0 || hour > kMaxHour) {
        throw ValidationError("Hour must be between 0 and 23, got " + std::to_string(hour));
    }
}

std::string FilterKey::toString() const {
    std::ostringstream ss;
    ss << month << "/" << std::setw(2) << std::setfill('0') << hour << "h/" << DayTypeToString(dayType);
    return ss.str();
}

} // namespace crowdpulse::domain
