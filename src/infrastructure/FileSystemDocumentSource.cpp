/**
 * @file FileSystemDocumentSource.cpp
 * @brief Implementation of FileSystemDocumentSource.
 */

#include "infrastructure/FileSystemDocumentSource.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace marksite::infrastructure {

FileSystemDocumentSource::FileSystemDocumentSource(const std::string& directory, const std::string& extension, bool sortByName)
    : m_directory(directory), m_extension(extension), m_sortByName(sortByName) {}

std::vector<domain::SourceFile> FileSystemDocumentSource::listDocuments() {
    std::vector<domain::SourceFile> files;
    if (!fs::is_directory(m_directory)) {
        return files;
    }

    for (const auto& entry : fs::directory_iterator(m_directory)) {
        if (!entry.is_regular_file()) continue;

        std::string name = entry.path().filename().string();
        if (name.empty() || name.front() == '.') continue;
        if (name.size() < m_extension.size() ||
            name.compare(name.size() - m_extension.size(), m_extension.size(), m_extension) != 0) {
            continue;
        }

        domain::SourceFile file;
        file.path = entry.path().string();
        file.slug = name.substr(0, name.size() - m_extension.size());
        files.push_back(file);
    }

    if (m_sortByName) {
        std::sort(files.begin(), files.end(), [](const domain::SourceFile& a, const domain::SourceFile& b) {
            return a.path < b.path;
        });
    }
    return files;
}

std::string FileSystemDocumentSource::readDocument(const domain::SourceFile& file) {
    std::ifstream in(file.path, std::ios::in | std::ios::binary);
    if (!in) {
        throw domain::SiteIoError("Could not read document: " + file.path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw domain::SiteIoError("Error while reading document: " + file.path);
    }
    return buffer.str();
}

} // namespace marksite::infrastructure
