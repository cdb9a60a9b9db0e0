/**
 * @file DateParser.cpp
 * @brief Implementation of DateParser.
 */

#include "domain/DateParser.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <vector>

namespace marksite::domain {

namespace {

struct Token {
    enum class Kind { Number, Word, Symbol };
    Kind kind;
    std::string text;       ///< Lower-cased for words.
    bool spaced = false;    ///< Whitespace came before this token.
    bool upper = false;     ///< Word was written in capitals.
};

/// Fields collected while walking the tokens; resolved and validated at the end.
struct Fields {
    std::optional<int> year;
    std::optional<int> month;
    std::optional<int> day;
    std::optional<int> hour;
    int minute = 0;
    int second = 0;
    int microsecond = 0;
    std::optional<int> offset;
    std::vector<std::string> looseNumbers;
};

const char* kMonths[] = {"jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};
const char* kFullMonths[] = {"january", "february", "march", "april", "may", "june", "july",
                             "august", "september", "october", "november", "december"};
const char* kWeekdays[] = {"mon", "tue", "tues", "wed", "thu", "thur", "thurs", "fri", "sat", "sun",
                           "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"};
const char* kFillers[] = {"at", "on", "of", "the", "and", "t"};

std::string Trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::optional<int> MonthFromWord(const std::string& word) {
    for (int i = 0; i < 12; ++i) {
        if (word == kMonths[i] || word == kFullMonths[i]) return i + 1;
    }
    if (word == "sept") return 9;
    return std::nullopt;
}

template <size_t N>
bool Contains(const char* (&list)[N], const std::string& word) {
    return std::find_if(std::begin(list), std::end(list), [&](const char* w) { return word == w; }) != std::end(list);
}

bool IsOrdinalSuffix(const std::string& word) {
    return word == "st" || word == "nd" || word == "rd" || word == "th";
}

int ExpandYear(const std::string& digits) {
    int value = std::stoi(digits);
    if (digits.size() <= 2) return value <= 68 ? 2000 + value : 1900 + value;
    return value;
}

int ParseFraction(std::string digits) {
    if (digits.size() > 6) digits.resize(6);
    while (digits.size() < 6) digits += '0';
    return std::stoi(digits);
}

std::vector<Token> Tokenize(const std::string& text, const std::string& original) {
    std::vector<Token> tokens;
    size_t i = 0;
    bool spaced = false;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (std::isspace(c)) {
            spaced = true;
            ++i;
            continue;
        } else if (std::isdigit(c)) {
            size_t start = i;
            while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
            if (i - start > 9) throw DateParseError(original, "number too long");
            tokens.push_back({Token::Kind::Number, text.substr(start, i - start), spaced});
        } else if (std::isalpha(c)) {
            size_t start = i;
            while (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i]))) ++i;
            std::string word = text.substr(start, i - start);
            bool upper = std::all_of(word.begin(), word.end(), [](unsigned char ch) { return std::isupper(ch) != 0; });
            std::transform(word.begin(), word.end(), word.begin(), [](unsigned char ch) { return std::tolower(ch); });
            tokens.push_back({Token::Kind::Word, word, spaced, upper});
        } else if (std::string(":/-.,+").find(static_cast<char>(c)) != std::string::npos) {
            tokens.push_back({Token::Kind::Symbol, std::string(1, static_cast<char>(c)), spaced});
            ++i;
        } else {
            throw DateParseError(original, std::string("unexpected character '") + static_cast<char>(c) + "'");
        }
        spaced = false;
    }
    return tokens;
}

void SetOnce(std::optional<int>& field, int value, const char* name, const std::string& original) {
    if (field) throw DateParseError(original, std::string("more than one ") + name);
    field = value;
}

/// Assigns year/month/day from a separator-joined numeric group such as 2024/01/15 or 15.01.24.
void ResolveNumericGroup(const std::vector<std::string>& parts, Fields& f, const std::string& original) {
    if (f.year || f.month || f.day) throw DateParseError(original, "more than one date");

    if (parts.size() == 2) {
        if (parts[0].size() == 4) {
            f.year = std::stoi(parts[0]);
            f.month = std::stoi(parts[1]);
            return;
        }
        int a = std::stoi(parts[0]);
        int b = std::stoi(parts[1]);
        if (a > 12) std::swap(a, b);
        f.month = a;
        f.day = b;
        return;
    }

    if (parts[0].size() >= 3) {
        f.year = ExpandYear(parts[0]);
        f.month = std::stoi(parts[1]);
        f.day = std::stoi(parts[2]);
        return;
    }

    int a = std::stoi(parts[0]);
    int b = std::stoi(parts[1]);
    f.year = ExpandYear(parts[2]);
    if (a > 12) {
        f.day = a;
        f.month = b;
    } else {
        f.month = a;
        f.day = b;
    }
}

void ApplyMeridiem(const std::string& word, Fields& f, const std::string& original) {
    if (!f.hour) throw DateParseError(original, "'" + word + "' without an hour");
    int h = *f.hour;
    if (h < 1 || h > 12) throw DateParseError(original, "hour out of range for 12-hour clock");
    if (word == "am") f.hour = (h == 12) ? 0 : h;
    else f.hour = (h == 12) ? 12 : h + 12;
}

/// Reads "+HHMM", "+HH:MM" or "+HH" starting at the sign; returns index of the next token.
size_t ParseOffset(const std::vector<Token>& tokens, size_t i, Fields& f, const std::string& original) {
    int sign = tokens[i].text == "-" ? -1 : 1;
    const std::string& digits = tokens[i + 1].text;
    int hours = 0;
    int minutes = 0;
    size_t next = i + 2;
    if (digits.size() == 4) {
        hours = std::stoi(digits.substr(0, 2));
        minutes = std::stoi(digits.substr(2, 2));
    } else if (digits.size() <= 2) {
        hours = std::stoi(digits);
        if (next + 1 < tokens.size() && tokens[next].text == ":" && tokens[next + 1].kind == Token::Kind::Number) {
            minutes = std::stoi(tokens[next + 1].text);
            next += 2;
        }
    } else {
        throw DateParseError(original, "malformed UTC offset");
    }
    if (hours > 14 || minutes > 59) throw DateParseError(original, "UTC offset out of range");
    SetOnce(f.offset, sign * (hours * 60 + minutes), "UTC offset", original);
    return next;
}

/// Consumes "HH:MM[:SS[.ffffff]]" starting at the hour; returns index of the next token.
size_t ParseTime(const std::vector<Token>& tokens, size_t i, Fields& f, const std::string& original) {
    SetOnce(f.hour, std::stoi(tokens[i].text), "time", original);
    f.minute = std::stoi(tokens[i + 2].text);
    size_t next = i + 3;
    auto isSymbolThenNumber = [&](size_t at, const char* symbol) {
        return at + 1 < tokens.size() && tokens[at].text == symbol && tokens[at + 1].kind == Token::Kind::Number;
    };
    if (isSymbolThenNumber(next, ":")) {
        f.second = std::stoi(tokens[next + 1].text);
        next += 2;
        if (isSymbolThenNumber(next, ".") || isSymbolThenNumber(next, ",")) {
            f.microsecond = ParseFraction(tokens[next + 1].text);
            next += 2;
        }
    }
    return next;
}

void Walk(const std::vector<Token>& tokens, Fields& f, const std::string& original) {
    size_t i = 0;
    while (i < tokens.size()) {
        const Token& tok = tokens[i];
        const Token* next = i + 1 < tokens.size() ? &tokens[i + 1] : nullptr;
        const Token* after = i + 2 < tokens.size() ? &tokens[i + 2] : nullptr;

        if (tok.kind == Token::Kind::Number) {
            if (next && next->text == ":" && after && after->kind == Token::Kind::Number) {
                i = ParseTime(tokens, i, f, original);
                continue;
            }
            // A numeric group is written without spaces: "2024-01-15", never "2024 - 10".
            if (next && (next->text == "/" || next->text == "-" || next->text == ".") && !next->spaced &&
                after && after->kind == Token::Kind::Number && !after->spaced) {
                std::vector<std::string> parts{tok.text, after->text};
                const std::string separator = next->text;
                i += 3;
                if (i + 1 < tokens.size() && tokens[i].text == separator && !tokens[i].spaced &&
                    tokens[i + 1].kind == Token::Kind::Number && !tokens[i + 1].spaced) {
                    parts.push_back(tokens[i + 1].text);
                    i += 2;
                }
                ResolveNumericGroup(parts, f, original);
                continue;
            }
            if (next && next->kind == Token::Kind::Word && IsOrdinalSuffix(next->text)) {
                SetOnce(f.day, std::stoi(tok.text), "day", original);
                i += 2;
                continue;
            }
            if (next && next->kind == Token::Kind::Word && (next->text == "am" || next->text == "pm") && !f.hour) {
                f.hour = std::stoi(tok.text);
                ApplyMeridiem(next->text, f, original);
                i += 2;
                continue;
            }
            if (tok.text.size() == 8 && !f.year && !f.month && !f.day) {
                f.year = std::stoi(tok.text.substr(0, 4));
                f.month = std::stoi(tok.text.substr(4, 2));
                f.day = std::stoi(tok.text.substr(6, 2));
                ++i;
                continue;
            }
            if (tok.text.size() > 4) throw DateParseError(original, "unrecognized number '" + tok.text + "'");
            f.looseNumbers.push_back(tok.text);
            ++i;
            continue;
        }

        if (tok.kind == Token::Kind::Word) {
            if (auto month = MonthFromWord(tok.text)) {
                SetOnce(f.month, *month, "month", original);
            } else if (tok.text == "am" || tok.text == "pm") {
                ApplyMeridiem(tok.text, f, original);
            } else if (tok.text == "z" || tok.text == "utc" || tok.text == "gmt") {
                bool explicitOffset = next && (next->text == "+" || next->text == "-") &&
                                      after && after->kind == Token::Kind::Number;
                if (!explicitOffset) SetOnce(f.offset, 0, "UTC offset", original);
            } else if (tok.upper && tok.text.size() >= 3 && tok.text.size() <= 5 && f.hour && !f.offset) {
                // Zone abbreviation we cannot resolve (PST, CEST): keep the local time, no offset.
            } else if (!Contains(kWeekdays, tok.text) && !Contains(kFillers, tok.text)) {
                throw DateParseError(original, "unknown word '" + tok.text + "'");
            }
            ++i;
            continue;
        }

        // Symbols
        if ((tok.text == "+" || tok.text == "-") && f.hour && next && next->kind == Token::Kind::Number) {
            i = ParseOffset(tokens, i, f, original);
            continue;
        }
        if (tok.text == ":" || tok.text == "+") {
            throw DateParseError(original, "unexpected '" + tok.text + "'");
        }
        ++i;
    }
}

void ResolveLooseNumbers(Fields& f, const std::string& original) {
    std::vector<std::string> rest;
    for (const auto& number : f.looseNumbers) {
        if (number.size() >= 3 || std::stoi(number) > 31) {
            SetOnce(f.year, ExpandYear(number), "year", original);
        } else {
            rest.push_back(number);
        }
    }

    if (!f.month && rest.size() >= 2) {
        std::vector<std::string> parts(rest.begin(), rest.begin() + 2);
        if (!f.year && rest.size() == 3) parts.push_back(rest[2]);
        else if (rest.size() > 2) throw DateParseError(original, "too many numbers");
        std::optional<int> year = f.year;
        f.year.reset();
        ResolveNumericGroup(parts, f, original);
        if (year) f.year = year;
        return;
    }

    size_t idx = 0;
    if (!f.day && idx < rest.size()) f.day = std::stoi(rest[idx++]);
    if (!f.year && idx < rest.size()) f.year = ExpandYear(rest[idx++]);
    if (idx < rest.size()) throw DateParseError(original, "unexpected number '" + rest[idx] + "'");
}

DateTime Validate(const Fields& f, const std::string& original) {
    if (!f.year) throw DateParseError(original, "no year");
    if (!f.month) throw DateParseError(original, "no month");

    DateTime result;
    result.year = *f.year;
    result.month = *f.month;
    result.day = f.day.value_or(1);
    result.hour = f.hour.value_or(0);
    result.minute = f.minute;
    result.second = f.second;
    result.microsecond = f.microsecond;
    result.utcOffsetMinutes = f.offset;

    if (result.year < 1 || result.year > 9999) throw DateParseError(original, "year out of range");
    if (result.month < 1 || result.month > 12) throw DateParseError(original, "month out of range");
    if (result.day < 1 || result.day > DateTime::DaysInMonth(result.year, result.month)) {
        throw DateParseError(original, "day out of range");
    }
    if (result.hour > 23 || result.minute > 59 || result.second > 59) {
        throw DateParseError(original, "time out of range");
    }
    return result;
}

std::optional<DateTime> ParseIso(const std::string& text, const std::string& original) {
    static const std::regex iso(
        R"(^(\d{4})-(\d{1,2})-(\d{1,2})(?:[Tt ](\d{1,2}):(\d{2})(?::(\d{2})(?:[.,](\d{1,9}))?)?)?\s*(Z|z|[+-]\d{2}(?::?\d{2})?)?$)");
    std::smatch m;
    if (!std::regex_match(text, m, iso)) return std::nullopt;

    Fields f;
    f.year = std::stoi(m[1].str());
    f.month = std::stoi(m[2].str());
    f.day = std::stoi(m[3].str());
    if (m[4].matched) {
        f.hour = std::stoi(m[4].str());
        f.minute = std::stoi(m[5].str());
        if (m[6].matched) f.second = std::stoi(m[6].str());
        if (m[7].matched) f.microsecond = ParseFraction(m[7].str());
    }
    if (m[8].matched) {
        std::string zone = m[8].str();
        if (zone == "Z" || zone == "z") {
            f.offset = 0;
        } else {
            zone.erase(std::remove(zone.begin(), zone.end(), ':'), zone.end());
            int hours = std::stoi(zone.substr(1, 2));
            int minutes = zone.size() > 3 ? std::stoi(zone.substr(3, 2)) : 0;
            if (hours > 14 || minutes > 59) throw DateParseError(original, "UTC offset out of range");
            f.offset = (zone[0] == '-' ? -1 : 1) * (hours * 60 + minutes);
        }
    }
    return Validate(f, original);
}

} // namespace

DateTime DateParser::Parse(const std::string& text) {
    std::string trimmed = Trim(text);
    if (trimmed.empty()) throw DateParseError(text, "empty string");

    if (auto iso = ParseIso(trimmed, text)) return *iso;

    Fields fields;
    Walk(Tokenize(trimmed, text), fields, text);
    ResolveLooseNumbers(fields, text);
    return Validate(fields, text);
}

std::optional<DateTime> DateParser::TryParse(const std::string& text) {
    try {
        return Parse(text);
    } catch (const DateParseError&) {
        return std::nullopt;
    }
}

} // namespace marksite::domain
