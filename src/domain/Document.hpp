/**
 * @file Document.hpp
 * @brief Domain entity representing one converted source document.
 */

#pragma once
#include <string>
#include <optional>
#include "domain/DateTime.hpp"

namespace marksite::domain {

/**
 * @class Document
 * @brief A rendered page plus the metadata the index needs. Immutable after construction.
 */
class Document {
public:
    Document(std::string slug, std::optional<std::string> title, std::optional<DateTime> date, std::string body)
        : m_slug(std::move(slug)), m_title(std::move(title)), m_date(std::move(date)), m_body(std::move(body)) {}

    /** @brief Source file name without its suffix. */
    const std::string& getSlug() const { return m_slug; }

    /** @brief First `title` metadata value, if the key was declared. */
    const std::optional<std::string>& getTitle() const { return m_title; }

    /** @brief Parsed first `date` metadata value. */
    const std::optional<DateTime>& getDate() const { return m_date; }

    /** @brief Converted HTML body. */
    const std::string& getBody() const { return m_body; }

private:
    std::string m_slug;
    std::optional<std::string> m_title;
    std::optional<DateTime> m_date;
    std::string m_body;
};

} // namespace marksite::domain
