/**
 * @file MetadataExtractor.hpp
 * @brief Interface for splitting a document's metadata header from its body.
 */

#pragma once
#include <map>
#include <string>
#include <vector>

namespace marksite::domain {

/// Lower-cased key to every value declared for it, in declaration order.
using Metadata = std::map<std::string, std::vector<std::string>>;

/**
 * @struct ExtractedDocument
 * @brief Metadata found at the top of a source text and the remaining markup.
 */
struct ExtractedDocument {
    Metadata metadata;
    std::string body;
};

/**
 * @class MetadataExtractor
 * @brief Extension point for metadata dialects (key/value header, front matter, ...).
 */
class MetadataExtractor {
public:
    virtual ~MetadataExtractor() = default;

    /**
     * @brief Separates the metadata header from the document text.
     * @param text Raw document content.
     * @return Parsed metadata (empty when there is no header) and the body still to be converted.
     */
    virtual ExtractedDocument extract(const std::string& text) const = 0;
};

/**
 * @brief Returns the first value declared for a key.
 * @return nullptr when the key is absent or has no values.
 */
inline const std::string* FirstValue(const Metadata& metadata, const std::string& key) {
    auto it = metadata.find(key);
    if (it == metadata.end() || it->second.empty()) return nullptr;
    return &it->second.front();
}

} // namespace marksite::domain
