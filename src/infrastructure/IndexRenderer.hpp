/**
 * @file IndexRenderer.hpp
 * @brief Renders the site index from an inja template.
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Document.hpp"

namespace marksite::infrastructure {

/**
 * @class IndexRenderer
 * @brief Binds the ordered document list to the index template. Output is HTML-escaped by default.
 *
 * inja has no per-variable `safe` filter: with escaping on, `post.html` prints as escaped text, so a
 * template can only link to pages through `post.url`. Turning escaping off lets the template embed
 * bodies, and every other value is then printed raw as well.
 *
 * Template variables:
 * - `post_list`: array of {slug, url, title, date, html, body}; `title` and `date` are null when absent.
 *   `date` holds {iso, text, date, year, month, day, hour, minute, second, month_name, display}.
 * - `post_count`: number of documents.
 * - `site`: {title}.
 */
class IndexRenderer {
public:
    IndexRenderer(const std::string& templateDir, const std::string& templateName, const std::string& outputExtension,
                  bool htmlAutoescape = true);

    /**
     * @brief Renders the index.
     * @param documents Documents in the order they should be listed.
     * @throws TemplateError when the template is missing, malformed or fails to render.
     */
    std::string render(const std::vector<domain::Document>& documents, const std::string& siteTitle = "") const;

    /** @brief The data object handed to the template. */
    nlohmann::json buildContext(const std::vector<domain::Document>& documents, const std::string& siteTitle) const;

    static nlohmann::json DateToJson(const domain::DateTime& date);

private:
    std::string m_templateDir;
    std::string m_templateName;
    std::string m_outputExtension;
    bool m_htmlAutoescape;
};

} // namespace marksite::infrastructure
