/**
 * @file DateTime.cpp
 * @brief Formatting helpers for DateTime.
 */

#include "domain/DateTime.hpp"
#include <cstdio>
#include <cstdlib>

namespace marksite::domain {

namespace {

const char* kMonthNames[] = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"
};

std::string FormatOffset(int minutes) {
    char buf[16];
    char sign = minutes < 0 ? '-' : '+';
    int total = std::abs(minutes);
    std::snprintf(buf, sizeof(buf), "%c%02d:%02d", sign, total / 60, total % 60);
    return buf;
}

} // namespace

std::string DateTime::toDateString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

std::string DateTime::toIsoString() const {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d", year, month, day, hour, minute, second);
    std::string result(buf);
    if (microsecond != 0) {
        std::snprintf(buf, sizeof(buf), ".%06d", microsecond);
        result += buf;
    }
    if (utcOffsetMinutes) result += FormatOffset(*utcOffsetMinutes);
    return result;
}

std::string DateTime::toString() const {
    std::string result = toIsoString();
    result[10] = ' ';
    return result;
}

std::string DateTime::toDisplayString() const {
    return monthName() + " " + std::to_string(day) + ", " + std::to_string(year);
}

std::string DateTime::monthName() const {
    if (month < 1 || month > 12) return "";
    return kMonthNames[month - 1];
}

bool DateTime::operator==(const DateTime& other) const {
    return year == other.year && month == other.month && day == other.day &&
           hour == other.hour && minute == other.minute && second == other.second &&
           microsecond == other.microsecond && utcOffsetMinutes == other.utcOffsetMinutes;
}

bool DateTime::IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DateTime::DaysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && IsLeapYear(year)) return 29;
    return days[month - 1];
}

} // namespace marksite::domain
