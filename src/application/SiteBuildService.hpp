/**
 * @file SiteBuildService.hpp
 * @brief Orchestrates a full site build: documents, pages, index and static assets.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "domain/Document.hpp"
#include "domain/DocumentSource.hpp"
#include "domain/MetadataExtractor.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/MarkdownConverter.hpp"
#include "infrastructure/SiteWriter.hpp"

namespace marksite::application {

/**
 * @class SiteBuildService
 * @brief Runs the build pipeline once, sequentially. Any failure propagates to the caller.
 *
 * Pages already written stay on disk when a later step fails.
 */
class SiteBuildService {
public:
    /**
     * @brief Result of a successful build.
     */
    struct BuildSummary {
        int documentsWritten = 0;
        bool indexWritten = false;
        int assetsCopied = 0;
        int warnings = 0;
    };

    SiteBuildService(infrastructure::SiteConfig config,
                     std::unique_ptr<domain::DocumentSource> source,
                     std::shared_ptr<domain::MetadataExtractor> extractor,
                     infrastructure::Logger& logger);

    /** @brief Wires the filesystem loader and the key/value metadata dialect from a configuration. */
    static std::unique_ptr<SiteBuildService> Create(const infrastructure::SiteConfig& config, infrastructure::Logger& logger);

    /**
     * @brief Converts and writes every document, renders the index and copies static assets.
     * @throws DateParseError, TemplateError, SiteIoError or std::filesystem::filesystem_error.
     */
    BuildSummary build();

    /**
     * @brief Converts every document and writes its page.
     * @return Documents in loader order.
     */
    std::vector<domain::Document> renderDocuments();

private:
    domain::Document convertDocument(const domain::SourceFile& file);

    infrastructure::SiteConfig m_config;
    std::unique_ptr<domain::DocumentSource> m_source;
    infrastructure::MarkdownConverter m_converter;
    infrastructure::SiteWriter m_writer;
    infrastructure::Logger& m_logger;
};

} // namespace marksite::application
