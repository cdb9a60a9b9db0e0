/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "domain/Errors.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace marksite::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw domain::ConfigError(std::string(ConfigLoader::kFileName) + ": invalid value for '" + key + "': " + e.what());
    }
}

std::string Resolve(const fs::path& root, const std::string& dir) {
    fs::path p(dir);
    if (p.is_absolute()) return p.string();
    return (root / p).string();
}

} // namespace

SiteConfig ConfigLoader::Load(const std::string& root) {
    SiteConfig config;
    fs::path rootPath(root);
    fs::path configPath = rootPath / kFileName;

    if (fs::exists(configPath)) {
        std::ifstream f(configPath);
        if (!f) throw domain::ConfigError("Unable to open " + configPath.string());

        nlohmann::json j;
        try {
            f >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw domain::ConfigError("Malformed " + configPath.string() + ": " + e.what());
        }
        if (!j.is_object()) throw domain::ConfigError(configPath.string() + " must contain a JSON object");

        ReadKey(j, "markdown_dir", config.markdownDir);
        ReadKey(j, "template_dir", config.templateDir);
        ReadKey(j, "index_template", config.indexTemplate);
        ReadKey(j, "static_dir", config.staticDir);
        ReadKey(j, "output_dir", config.outputDir);
        ReadKey(j, "document_extension", config.documentExtension);
        ReadKey(j, "output_extension", config.outputExtension);
        ReadKey(j, "site_title", config.siteTitle);
        ReadKey(j, "strict_dates", config.strictDates);
        ReadKey(j, "sort_documents", config.sortDocuments);
        ReadKey(j, "allow_unsafe_names", config.allowUnsafeNames);
        ReadKey(j, "index_autoescape", config.indexAutoescape);

        std::string levelName;
        ReadKey(j, "log_level", levelName);
        if (!levelName.empty()) {
            auto level = Logger::ParseLevel(levelName);
            if (!level) throw domain::ConfigError("Unknown log_level '" + levelName + "'");
            config.logLevel = *level;
        }
    }

    config.markdownDir = Resolve(rootPath, config.markdownDir);
    config.templateDir = Resolve(rootPath, config.templateDir);
    config.staticDir = Resolve(rootPath, config.staticDir);
    config.outputDir = Resolve(rootPath, config.outputDir);
    return config;
}

} // namespace marksite::infrastructure
