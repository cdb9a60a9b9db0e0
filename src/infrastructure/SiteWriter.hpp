/**
 * @file SiteWriter.hpp
 * @brief Writes rendered pages and the index into the output directory.
 */

#pragma once
#include <string>

namespace marksite::infrastructure {

/**
 * @class SiteWriter
 * @brief Owns the output directory layout: `<output>/<slug><ext>` and `<output>/index<ext>`.
 *
 * Existing files are overwritten. The output directory is created on first write.
 */
class SiteWriter {
public:
    SiteWriter(const std::string& outputDir, const std::string& outputExtension, bool allowUnsafeNames = false);

    /**
     * @brief Writes one converted document verbatim.
     * @return Path of the written file.
     * @throws SiteIoError when the slug could escape the output directory (unless allowed) or the write fails.
     */
    std::string writePage(const std::string& slug, const std::string& html);

    /** @brief Writes the rendered index page. */
    std::string writeIndex(const std::string& html);

    /** @brief Path a page with this slug is written to. */
    std::string pagePath(const std::string& slug) const;

    /** @brief File name (not path) of a page, used for links in the index. */
    std::string pageFileName(const std::string& slug) const { return slug + m_outputExtension; }

    /** @brief False for empty names, "." and "..", and names holding a path separator. */
    static bool IsSafeName(const std::string& name);

private:
    void writeFile(const std::string& path, const std::string& content);

    std::string m_outputDir;
    std::string m_outputExtension;
    bool m_allowUnsafeNames;
};

} // namespace marksite::infrastructure
