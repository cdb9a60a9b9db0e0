/**
 * @file StaticAssetCopier.cpp
 * @brief Implementation of StaticAssetCopier.
 */

#include "infrastructure/StaticAssetCopier.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace marksite::infrastructure {

StaticAssetCopier::StaticAssetCopier(const std::string& staticDir, const std::string& outputDir)
    : m_staticDir(staticDir), m_outputDir(outputDir) {}

std::vector<std::string> StaticAssetCopier::copyAll() {
    if (!fs::is_directory(m_staticDir)) {
        throw domain::SiteIoError("Static asset directory not found: " + m_staticDir);
    }

    std::vector<fs::path> sources;
    for (const auto& entry : fs::directory_iterator(m_staticDir)) {
        std::string name = entry.path().filename().string();
        if (name.empty() || name.front() == '.') continue;
        sources.push_back(entry.path());
    }
    std::sort(sources.begin(), sources.end());

    fs::create_directories(m_outputDir);

    std::vector<std::string> copied;
    for (const auto& source : sources) {
        if (fs::is_directory(source)) {
            throw domain::SiteIoError("Static asset is a directory: " + source.string());
        }
        fs::path target = fs::path(m_outputDir) / source.filename();
        fs::copy_file(source, target, fs::copy_options::overwrite_existing);
        copied.push_back(target.string());
    }
    return copied;
}

} // namespace marksite::infrastructure
