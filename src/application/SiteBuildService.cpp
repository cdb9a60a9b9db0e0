/**
 * @file SiteBuildService.cpp
 * @brief Implementation of SiteBuildService.
 */

#include "application/SiteBuildService.hpp"
#include "domain/DateParser.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/FileSystemDocumentSource.hpp"
#include "infrastructure/IndexRenderer.hpp"
#include "infrastructure/MetaBlockExtractor.hpp"
#include "infrastructure/StaticAssetCopier.hpp"

namespace marksite::application {

namespace {
const char* kTag = "SiteBuilder";
}

SiteBuildService::SiteBuildService(infrastructure::SiteConfig config,
                                   std::unique_ptr<domain::DocumentSource> source,
                                   std::shared_ptr<domain::MetadataExtractor> extractor,
                                   infrastructure::Logger& logger)
    : m_config(std::move(config)),
      m_source(std::move(source)),
      m_converter(std::move(extractor)),
      m_writer(m_config.outputDir, m_config.outputExtension, m_config.allowUnsafeNames),
      m_logger(logger) {}

std::unique_ptr<SiteBuildService> SiteBuildService::Create(const infrastructure::SiteConfig& config, infrastructure::Logger& logger) {
    auto source = std::make_unique<infrastructure::FileSystemDocumentSource>(
        config.markdownDir, config.documentExtension, config.sortDocuments);
    auto extractor = std::make_shared<infrastructure::MetaBlockExtractor>();
    return std::make_unique<SiteBuildService>(config, std::move(source), std::move(extractor), logger);
}

SiteBuildService::BuildSummary SiteBuildService::build() {
    BuildSummary summary;
    int warningsAtStart = m_logger.warningCount();
    m_logger.info(kTag, "Starting");

    std::vector<domain::Document> documents = renderDocuments();
    summary.documentsWritten = static_cast<int>(documents.size());

    m_logger.info(kTag, "Rendering index...");
    infrastructure::IndexRenderer renderer(m_config.templateDir, m_config.indexTemplate, m_config.outputExtension,
                                           m_config.indexAutoescape);
    std::string indexPath = m_writer.writeIndex(renderer.render(documents, m_config.siteTitle));
    summary.indexWritten = true;
    m_logger.debug(kTag, "Wrote " + indexPath);

    m_logger.info(kTag, "Copying static assets...");
    infrastructure::StaticAssetCopier copier(m_config.staticDir, m_config.outputDir);
    for (const auto& path : copier.copyAll()) {
        m_logger.debug(kTag, "Copied " + path);
        ++summary.assetsCopied;
    }

    summary.warnings = m_logger.warningCount() - warningsAtStart;
    m_logger.info(kTag, "Finishing");
    return summary;
}

std::vector<domain::Document> SiteBuildService::renderDocuments() {
    std::vector<domain::SourceFile> files = m_source->listDocuments();
    if (files.empty()) {
        m_logger.warning(kTag, "No files found matching " + m_config.markdownDir + "/*" + m_config.documentExtension);
    }

    m_logger.info(kTag, "Rendering markdown files...");
    std::vector<domain::Document> documents;
    documents.reserve(files.size());
    for (const auto& file : files) {
        domain::Document doc = convertDocument(file);
        std::string path = m_writer.writePage(doc.getSlug(), doc.getBody());
        m_logger.debug(kTag, "Wrote " + path);
        documents.push_back(std::move(doc));
    }
    return documents;
}

domain::Document SiteBuildService::convertDocument(const domain::SourceFile& file) {
    infrastructure::ConvertedDocument converted = m_converter.convert(m_source->readDocument(file));

    std::optional<std::string> title;
    if (const std::string* value = domain::FirstValue(converted.metadata, "title")) {
        title = *value;
    }

    std::optional<domain::DateTime> date;
    const std::string* rawDate = domain::FirstValue(converted.metadata, "date");
    if (rawDate && !rawDate->empty()) {
        if (m_config.strictDates) {
            date = domain::DateParser::Parse(*rawDate);
        } else {
            try {
                date = domain::DateParser::Parse(*rawDate);
            } catch (const domain::DateParseError& e) {
                m_logger.warning(kTag, file.slug + ": " + e.what() + "; date left empty");
            }
        }
    }

    return domain::Document(file.slug, std::move(title), std::move(date), std::move(converted.html));
}

} // namespace marksite::application
