/**
 * @file FilterKey.hpp
 * @brief Composite (month, hour, day type) key partitioning the observation dataset.
 */

#pragma once
#include <cstddef>
#include <functional>
#include <string>

namespace crowdpulse::domain {

/**
 * @enum DayType
 * @brief Calendar class of the observation day.
 */
enum class DayType {
    Weekday,
    Weekend
};

/** @brief Canonical English token ("weekday" / "weekend"). */
std::string DayTypeToString(DayType type);

/** @brief Localized label used by the dataset ("平日" / "假日"). */
std::string DayTypeToLabel(DayType type);

/**
 * @brief Normalizes a day-type label coming from the boundary.
 * Accepts the localized labels and the English tokens (case-insensitive).
 * @throws ValidationError for any other label.
 */
DayType ParseDayType(const std::string& label);

/**
 * @struct FilterKey
 * @brief Request-scoped identifier of one dataset partition.
 *
 * Use FilterKey::Make to build a validated key from untrusted input.
 */
struct FilterKey {
    static constexpr int kMinMonth = 100001;
    static constexpr int kMaxMonth = 999912;
    static constexpr int kMaxHour = 23;

    int month = 0;     ///< YYYYMM.
    int hour = 0;      ///< 0-23.
    DayType dayType = DayType::Weekday;

    /**
     * @brief Builds a key after range-checking every component.
     * @throws ValidationError when month or hour is out of range.
     */
    static FilterKey Make(int month, int hour, DayType dayType);

    /** @overload Normalizes the day-type label first. */
    static FilterKey Make(int month, int hour, const std::string& dayTypeLabel);

    /** @brief Throws ValidationError if the key is out of range. */
    void validate() const;

    /** @brief Human-readable form, e.g. "202412/08h/weekday". */
    std::string toString() const;

    bool operator==(const FilterKey& other) const {
        return month == other.month && hour == other.hour && dayType == other.dayType;
    }
    bool operator!=(const FilterKey& other) const { return !(*this == other); }
};

/** @brief Hash functor so FilterKey can index unordered containers. */
struct FilterKeyHash {
    std::size_t operator()(const FilterKey& key) const noexcept {
        std::size_t h = std::hash<int>{}(key.month);
        h = h * 31 + std::hash<int>{}(key.hour);
        h = h * 31 + static_cast<std::size_t>(key.dayType);
        return h;
    }
};

} // namespace crowdpulse::domain
