/**
 * @file ConfigLoader.hpp
 * @brief Loads the optional site.json that overrides the default directory layout.
 */

#pragma once

#include <string>
#include "infrastructure/Logger.hpp"

namespace marksite::infrastructure {

/**
 * @struct SiteConfig
 * @brief Build settings. Relative paths are resolved against the working root by ConfigLoader.
 */
struct SiteConfig {
    std::string markdownDir = "src/markdowns";
    std::string templateDir = "src/templates";
    std::string indexTemplate = "index.html";
    std::string staticDir = "src/static";
    std::string outputDir = "build";
    std::string documentExtension = ".md";
    std::string outputExtension = ".html";
    std::string siteTitle;
    LogLevel logLevel = LogLevel::Info;
    bool strictDates = true;      ///< Unparsable dates abort the run when true, else warn and drop the date.
    bool sortDocuments = true;    ///< Sort by file name instead of directory enumeration order.
    bool allowUnsafeNames = false;
    bool indexAutoescape = true;  ///< HTML-escape every value printed by the index template.
};

class ConfigLoader {
public:
    static constexpr const char* kFileName = "site.json";

    /**
     * @brief Reads <root>/site.json on top of the defaults.
     * @param root Working root; every relative directory in the result is prefixed with it.
     * @return Defaults when the file does not exist.
     * @throws domain::ConfigError on malformed JSON, wrongly typed values or an unknown log level.
     */
    static SiteConfig Load(const std::string& root);
};

} // namespace marksite::infrastructure
