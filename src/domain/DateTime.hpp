/**
 * @file DateTime.hpp
 * @brief Value object for a calendar date/time parsed from document metadata.
 */

#pragma once
#include <string>
#include <optional>

namespace marksite::domain {

/**
 * @struct DateTime
 * @brief Broken-down calendar timestamp. No time zone conversion is ever applied.
 */
struct DateTime {
    int year = 1970;
    int month = 1;      ///< 1-12.
    int day = 1;        ///< 1-31, validated against the month.
    int hour = 0;
    int minute = 0;
    int second = 0;
    int microsecond = 0;
    std::optional<int> utcOffsetMinutes; ///< Set only when the source text named a zone.

    /** @brief Returns e.g. "2024-01-15T10:30:00" (fraction and offset appended when present). */
    std::string toIsoString() const;

    /** @brief Returns e.g. "2024-01-15 10:30:00+02:00". */
    std::string toString() const;

    /** @brief Returns "2024-01-15". */
    std::string toDateString() const;

    /** @brief Returns "January 15, 2024". */
    std::string toDisplayString() const;

    /** @brief English month name for the current month. */
    std::string monthName() const;

    bool operator==(const DateTime& other) const;
    bool operator!=(const DateTime& other) const { return !(*this == other); }

    static bool IsLeapYear(int year);
    static int DaysInMonth(int year, int month);
};

} // namespace marksite::domain
