/**
 * @file DocumentSource.hpp
 * @brief Interface for enumerating and reading source documents.
 */

#pragma once
#include <string>
#include <vector>

namespace marksite::domain {

/**
 * @struct SourceFile
 * @brief A source document found by the loader.
 */
struct SourceFile {
    std::string path; ///< Full path of the file.
    std::string slug; ///< File name without the document suffix.
};

/**
 * @class DocumentSource
 * @brief Abstract access to the documents a site is built from.
 */
class DocumentSource {
public:
    virtual ~DocumentSource() = default;

    /** @brief Lists the documents in build order. An empty result is not an error. */
    virtual std::vector<SourceFile> listDocuments() = 0;

    /**
     * @brief Reads the raw text of a document.
     * @throws SiteIoError when the file cannot be read.
     */
    virtual std::string readDocument(const SourceFile& file) = 0;
};

} // namespace marksite::domain
