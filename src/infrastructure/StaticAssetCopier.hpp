/**
 * @file StaticAssetCopier.hpp
 * @brief Copies the static asset directory into the output directory.
 */

#pragma once
#include <string>
#include <vector>

namespace marksite::infrastructure {

/**
 * @class StaticAssetCopier
 * @brief Byte-copies every top-level entry of a directory, keeping file names.
 */
class StaticAssetCopier {
public:
    StaticAssetCopier(const std::string& staticDir, const std::string& outputDir);

    /**
     * @brief Copies each non-hidden entry, overwriting existing files.
     * @return Destination paths, in the order copied.
     * @throws SiteIoError when the static directory is missing or an entry is a directory.
     * @throws std::filesystem::filesystem_error when a copy fails.
     */
    std::vector<std::string> copyAll();

private:
    std::string m_staticDir;
    std::string m_outputDir;
};

} // namespace marksite::infrastructure
