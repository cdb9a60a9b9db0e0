/**
 * @file Errors.hpp
 * @brief Exception types raised by the build pipeline.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace marksite::domain {

/** @brief A metadata date matched no recognized grammar. */
class DateParseError : public std::runtime_error {
public:
    DateParseError(const std::string& input, const std::string& reason)
        : std::runtime_error("Unable to parse date '" + input + "': " + reason), m_input(input) {}

    const std::string& getInput() const { return m_input; }

private:
    std::string m_input;
};

/** @brief The index template is missing or failed to render. */
class TemplateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief Reading or writing a site file failed. */
class SiteIoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief site.json is malformed or holds a value of the wrong type. */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace marksite::domain
