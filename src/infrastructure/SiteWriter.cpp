/**
 * @file SiteWriter.cpp
 * @brief Implementation of SiteWriter.
 */

#include "infrastructure/SiteWriter.hpp"
#include "domain/Errors.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace marksite::infrastructure {

SiteWriter::SiteWriter(const std::string& outputDir, const std::string& outputExtension, bool allowUnsafeNames)
    : m_outputDir(outputDir), m_outputExtension(outputExtension), m_allowUnsafeNames(allowUnsafeNames) {}

std::string SiteWriter::pagePath(const std::string& slug) const {
    return (fs::path(m_outputDir) / pageFileName(slug)).string();
}

std::string SiteWriter::writePage(const std::string& slug, const std::string& html) {
    if (!m_allowUnsafeNames && !IsSafeName(slug)) {
        throw domain::SiteIoError("Refusing to write page with unsafe name '" + slug + "'");
    }
    std::string path = pagePath(slug);
    writeFile(path, html);
    return path;
}

std::string SiteWriter::writeIndex(const std::string& html) {
    std::string path = (fs::path(m_outputDir) / ("index" + m_outputExtension)).string();
    writeFile(path, html);
    return path;
}

bool SiteWriter::IsSafeName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

void SiteWriter::writeFile(const std::string& path, const std::string& content) {
    std::error_code ec;
    fs::create_directories(m_outputDir, ec);
    if (ec) {
        throw domain::SiteIoError("Could not create output directory " + m_outputDir + ": " + ec.message());
    }

    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
        throw domain::SiteIoError("Could not write file: " + path);
    }
    out << content;
    out.flush();
    if (!out) {
        throw domain::SiteIoError("Write failed: " + path);
    }
}

} // namespace marksite::infrastructure
