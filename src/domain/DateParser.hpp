/**
 * @file DateParser.hpp
 * @brief Best-effort parser for the free-form dates written in document metadata.
 */

#pragma once
#include <string>
#include <optional>
#include "domain/DateTime.hpp"

namespace marksite::domain {

/**
 * @brief Stateless parser accepting ISO 8601, named-month and numeric date forms.
 *
 * Recognized inputs include "2024-01-15", "2024-01-15T10:30:00+02:00", "20240115",
 * "January 15, 2024", "15 Jan 2024", "Mon, 15 Jan 2024 10:30 GMT", "15th of January 2024",
 * "01/15/2024", "15.01.2024" and "Jan 2024". Numeric groups are read month first unless the
 * first part cannot be a month. A missing day defaults to 1, a missing time to midnight.
 */
class DateParser {
public:
    /**
     * @brief Parses a date string.
     * @param text Non-empty date text.
     * @return Parsed value.
     * @throws DateParseError when the text matches no recognized grammar or names an impossible date.
     */
    static DateTime Parse(const std::string& text);

    /** @brief Same as Parse but returns nullopt instead of throwing. */
    static std::optional<DateTime> TryParse(const std::string& text);
};

} // namespace marksite::domain
