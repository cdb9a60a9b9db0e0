/**
 * @file MarkdownConverter.hpp
 * @brief Markdown to HTML conversion backed by md4c.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/MetadataExtractor.hpp"

namespace marksite::infrastructure {

/**
 * @struct ConvertedDocument
 * @brief HTML body plus the metadata found in the document header.
 */
struct ConvertedDocument {
    std::string html;
    domain::Metadata metadata;
};

/**
 * @class MarkdownConverter
 * @brief Strips the metadata header with the injected extractor and renders the rest as HTML.
 */
class MarkdownConverter {
public:
    explicit MarkdownConverter(std::shared_ptr<domain::MetadataExtractor> extractor);

    /**
     * @brief Converts a whole source document.
     * @throws std::runtime_error if md4c rejects the input.
     */
    ConvertedDocument convert(const std::string& text) const;

    /**
     * @brief Renders Markdown to HTML without looking for metadata.
     * @throws std::runtime_error if md4c rejects the input.
     */
    static std::string RenderHtml(const std::string& markdown);

private:
    std::shared_ptr<domain::MetadataExtractor> m_extractor;
};

} // namespace marksite::infrastructure
