/**
 * @file MarkdownConverter.cpp
 * @brief Implementation of MarkdownConverter.
 */

#include "infrastructure/MarkdownConverter.hpp"
#include <md4c-html.h>
#include <stdexcept>

namespace marksite::infrastructure {

namespace {

void AppendOutput(const MD_CHAR* text, MD_SIZE size, void* userdata) {
    static_cast<std::string*>(userdata)->append(text, size);
}

} // namespace

MarkdownConverter::MarkdownConverter(std::shared_ptr<domain::MetadataExtractor> extractor)
    : m_extractor(std::move(extractor)) {}

ConvertedDocument MarkdownConverter::convert(const std::string& text) const {
    domain::ExtractedDocument extracted = m_extractor->extract(text);
    ConvertedDocument result;
    result.html = RenderHtml(extracted.body);
    result.metadata = std::move(extracted.metadata);
    return result;
}

std::string MarkdownConverter::RenderHtml(const std::string& markdown) {
    std::string html;
    html.reserve(markdown.size() + markdown.size() / 4);
    int ret = md_html(markdown.c_str(), static_cast<MD_SIZE>(markdown.size()),
                      AppendOutput, &html, MD_DIALECT_GITHUB, 0);
    if (ret != 0) {
        throw std::runtime_error("Markdown conversion failed");
    }
    return html;
}

} // namespace marksite::infrastructure
