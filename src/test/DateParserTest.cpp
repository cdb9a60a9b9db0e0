#include <cassert>
#include <iostream>
#include <string>

#include "domain/DateParser.hpp"
#include "domain/Errors.hpp"

using namespace marksite::domain;

namespace {

void ExpectDate(const std::string& text, int year, int month, int day, int hour = 0, int minute = 0, int second = 0) {
    DateTime dt = DateParser::Parse(text);
    if (dt.year != year || dt.month != month || dt.day != day ||
        dt.hour != hour || dt.minute != minute || dt.second != second) {
        std::cout << "[FAIL] '" << text << "' parsed as " << dt.toIsoString() << std::endl;
        assert(false);
    }
}

void ExpectFailure(const std::string& text) {
    bool threw = false;
    try {
        DateParser::Parse(text);
    } catch (const DateParseError& e) {
        threw = true;
        assert(e.getInput() == text);
    }
    if (!threw) std::cout << "[FAIL] '" << text << "' should not parse" << std::endl;
    assert(threw);
    assert(!DateParser::TryParse(text));
}

} // namespace

int main() {
    std::cout << "[Test] Starting DateParser Test..." << std::endl;

    // ISO 8601
    ExpectDate("2024-01-15", 2024, 1, 15);
    ExpectDate("  2024-01-15\n", 2024, 1, 15);
    ExpectDate("2024-01-15T10:30", 2024, 1, 15, 10, 30);
    ExpectDate("2024-01-15 10:30:05", 2024, 1, 15, 10, 30, 5);
    ExpectDate("20240115", 2024, 1, 15);

    DateTime zoned = DateParser::Parse("2024-01-15T10:30:00+02:00");
    assert(zoned.utcOffsetMinutes && *zoned.utcOffsetMinutes == 120);
    assert(zoned.toIsoString() == "2024-01-15T10:30:00+02:00");

    DateTime utc = DateParser::Parse("2024-01-15T10:30:00Z");
    assert(utc.utcOffsetMinutes && *utc.utcOffsetMinutes == 0);

    DateTime fractional = DateParser::Parse("2024-01-15 10:30:05.25");
    assert(fractional.microsecond == 250000);
    assert(!fractional.utcOffsetMinutes);

    // Named months
    ExpectDate("January 15, 2024", 2024, 1, 15);
    ExpectDate("15 January 2024", 2024, 1, 15);
    ExpectDate("Jan 15 2024", 2024, 1, 15);
    ExpectDate("Jan. 15, 2024", 2024, 1, 15);
    ExpectDate("15-Jan-2024", 2024, 1, 15);
    ExpectDate("Sept 3, 1999", 1999, 9, 3);
    ExpectDate("15th of January, 2024", 2024, 1, 15);
    ExpectDate("March 2024", 2024, 3, 1);
    ExpectDate("Jan 15 24", 2024, 1, 15);

    DateTime rfc = DateParser::Parse("Mon, 15 Jan 2024 10:30:00 GMT");
    assert(rfc.day == 15 && rfc.hour == 10 && rfc.minute == 30);
    assert(rfc.utcOffsetMinutes && *rfc.utcOffsetMinutes == 0);

    DateTime offset = DateParser::Parse("January 15, 2024 at 10:30 -0500");
    assert(offset.utcOffsetMinutes && *offset.utcOffsetMinutes == -300);

    ExpectDate("January 15, 2024 5pm", 2024, 1, 15, 17);
    ExpectDate("January 15, 2024 12:15 am", 2024, 1, 15, 0, 15);
    ExpectDate("January 15, 2024 12:15 PM", 2024, 1, 15, 12, 15);

    // Numeric groups
    ExpectDate("2024/01/15", 2024, 1, 15);
    ExpectDate("01/15/2024", 2024, 1, 15);
    ExpectDate("15/01/2024", 2024, 1, 15);
    ExpectDate("15.01.2024", 2024, 1, 15);
    ExpectDate("03/04/05", 2005, 3, 4);
    ExpectDate("1/2/99", 1999, 1, 2);
    ExpectDate("2024-02-29", 2024, 2, 29);

    // Spaced separators are not part of a numeric date
    ExpectDate("Jan 15, 2024 - 10:30", 2024, 1, 15, 10, 30);
    ExpectDate("January 15, 2024 / 10:30", 2024, 1, 15, 10, 30);
    ExpectDate("15 - 01 - 2024", 2024, 1, 15);

    // Unresolvable zone abbreviations after a time are dropped
    DateTime pacific = DateParser::Parse("Jan 15, 2024 10:30 PST");
    assert(pacific.hour == 10 && pacific.minute == 30);
    assert(!pacific.utcOffsetMinutes);
    ExpectDate("Mon, 15 Jan 2024 08:00 PM CEST", 2024, 1, 15, 20, 0);

    // Failures
    ExpectFailure("PST Jan 15, 2024");
    ExpectFailure("Jan 15, 2024 10:30 pst");
    ExpectFailure("not-a-date");
    ExpectFailure("");
    ExpectFailure("   ");
    ExpectFailure("yesterday");
    ExpectFailure("2023-02-29");
    ExpectFailure("2024-13-01");
    ExpectFailure("January 32, 2024");
    ExpectFailure("10:30");
    ExpectFailure("2024");
    ExpectFailure("January 15");
    ExpectFailure("2024-01-15 25:00");
    ExpectFailure("13pm January 15, 2024");
    ExpectFailure("Jan Feb 2024");
    ExpectFailure("2024-01-15 #1");
    ExpectFailure("123456789012");

    // Formatting
    DateTime dt = DateParser::Parse("2024-01-15");
    assert(dt.toDateString() == "2024-01-15");
    assert(dt.toString() == "2024-01-15 00:00:00");
    assert(dt.toDisplayString() == "January 15, 2024");
    assert(dt.monthName() == "January");
    assert(dt == DateParser::Parse("January 15, 2024"));

    std::cout << "[PASS] DateParser Test." << std::endl;
    return 0;
}
