/**
 * @file MetaBlockExtractor.hpp
 * @brief "key: value" metadata header dialect.
 */

#pragma once
#include "domain/MetadataExtractor.hpp"

namespace marksite::infrastructure {

/**
 * @class MetaBlockExtractor
 * @brief Reads a header of `key: value` lines terminated by a blank line.
 *
 * Keys match [A-Za-z0-9_-]+ after at most three spaces and are lower-cased. A line indented by four
 * or more columns (a tab counts as four) adds another value to the previous key. An optional leading
 * `---` line is skipped, and a `---` or `...` line also closes the header. The first line that fits
 * none of these stays in the body. A text with no header is returned unchanged.
 */
class MetaBlockExtractor : public domain::MetadataExtractor {
public:
    domain::ExtractedDocument extract(const std::string& text) const override;
};

} // namespace marksite::infrastructure
