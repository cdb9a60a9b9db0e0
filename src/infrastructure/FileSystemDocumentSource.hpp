/**
 * @file FileSystemDocumentSource.hpp
 * @brief Loads source documents from a flat directory.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/DocumentSource.hpp"

namespace marksite::infrastructure {

/**
 * @class FileSystemDocumentSource
 * @brief Lists the regular files of one directory that end with the document suffix.
 *
 * Hidden files (leading '.') are skipped, matching shell glob semantics. A missing directory
 * yields no documents.
 */
class FileSystemDocumentSource : public domain::DocumentSource {
public:
    /**
     * @param directory Directory holding the documents (not searched recursively).
     * @param extension Case-sensitive suffix, e.g. ".md".
     * @param sortByName List in file name order instead of directory enumeration order.
     */
    FileSystemDocumentSource(const std::string& directory, const std::string& extension, bool sortByName = true);

    std::vector<domain::SourceFile> listDocuments() override;
    std::string readDocument(const domain::SourceFile& file) override;

private:
    std::string m_directory;
    std::string m_extension;
    bool m_sortByName;
};

} // namespace marksite::infrastructure
