/**
 * @file main.cpp
 * @brief Entry point: builds the site rooted at the current directory (or argv[1]).
 */

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include "application/SiteBuildService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/Logger.hpp"

using namespace marksite;

int main(int argc, char** argv) {
    infrastructure::Logger logger(std::cerr);

    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [site-root]" << std::endl;
        return 1;
    }

    try {
        std::string root = argc == 2 ? argv[1] : std::filesystem::current_path().string();
        infrastructure::SiteConfig config = infrastructure::ConfigLoader::Load(root);
        logger.setLevel(config.logLevel);

        auto service = application::SiteBuildService::Create(config, logger);
        service->build();
    } catch (const std::exception& e) {
        logger.error("MarkSite", e.what());
        return 1;
    }
    return 0;
}
