/**
 * @file IndexRenderer.cpp
 * @brief Implementation of IndexRenderer.
 */

#include "infrastructure/IndexRenderer.hpp"
#include "domain/Errors.hpp"
#include <filesystem>
#include <inja/inja.hpp>

namespace fs = std::filesystem;

namespace marksite::infrastructure {

IndexRenderer::IndexRenderer(const std::string& templateDir, const std::string& templateName, const std::string& outputExtension,
                             bool htmlAutoescape)
    : m_templateDir(templateDir), m_templateName(templateName), m_outputExtension(outputExtension),
      m_htmlAutoescape(htmlAutoescape) {}

nlohmann::json IndexRenderer::DateToJson(const domain::DateTime& date) {
    nlohmann::json j;
    j["iso"] = date.toIsoString();
    j["text"] = date.toString();
    j["date"] = date.toDateString();
    j["year"] = date.year;
    j["month"] = date.month;
    j["day"] = date.day;
    j["hour"] = date.hour;
    j["minute"] = date.minute;
    j["second"] = date.second;
    j["month_name"] = date.monthName();
    j["display"] = date.toDisplayString();
    return j;
}

nlohmann::json IndexRenderer::buildContext(const std::vector<domain::Document>& documents, const std::string& siteTitle) const {
    nlohmann::json posts = nlohmann::json::array();
    for (const auto& doc : documents) {
        nlohmann::json post;
        post["slug"] = doc.getSlug();
        post["url"] = doc.getSlug() + m_outputExtension;
        post["title"] = doc.getTitle() ? nlohmann::json(*doc.getTitle()) : nlohmann::json(nullptr);
        post["date"] = doc.getDate() ? DateToJson(*doc.getDate()) : nlohmann::json(nullptr);
        post["html"] = doc.getBody();
        post["body"] = doc.getBody();
        posts.push_back(std::move(post));
    }

    nlohmann::json data;
    data["post_list"] = std::move(posts);
    data["post_count"] = documents.size();
    data["site"] = {{"title", siteTitle}};
    return data;
}

std::string IndexRenderer::render(const std::vector<domain::Document>& documents, const std::string& siteTitle) const {
    fs::path templatePath = fs::path(m_templateDir) / m_templateName;
    if (!fs::is_regular_file(templatePath)) {
        throw domain::TemplateError("Template not found: " + templatePath.string());
    }

    try {
        inja::Environment env{(fs::path(m_templateDir) / "").string()};
        env.set_html_autoescape(m_htmlAutoescape);
        inja::Template tmpl = env.parse_template(m_templateName);
        return env.render(tmpl, buildContext(documents, siteTitle));
    } catch (const inja::InjaError& e) {
        throw domain::TemplateError("Failed to render " + templatePath.string() + ": " + e.what());
    }
}

} // namespace marksite::infrastructure
