#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace fs = std::filesystem;
using namespace marksite;

namespace {

void WriteConfig(const fs::path& root, const std::string& content) {
    std::ofstream out(root / infrastructure::ConfigLoader::kFileName);
    out << content;
}

bool LoadFails(const fs::path& root) {
    try {
        infrastructure::ConfigLoader::Load(root.string());
    } catch (const domain::ConfigError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    fs::path testRoot = fs::temp_directory_path() / "marksite_config_test";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    // Defaults when site.json is absent
    {
        auto config = infrastructure::ConfigLoader::Load(testRoot.string());
        assert(config.markdownDir == (testRoot / "src/markdowns").string());
        assert(config.templateDir == (testRoot / "src/templates").string());
        assert(config.staticDir == (testRoot / "src/static").string());
        assert(config.outputDir == (testRoot / "build").string());
        assert(config.indexTemplate == "index.html");
        assert(config.documentExtension == ".md");
        assert(config.outputExtension == ".html");
        assert(config.logLevel == infrastructure::LogLevel::Info);
        assert(config.strictDates);
        assert(config.sortDocuments);
        assert(!config.allowUnsafeNames);
        assert(config.indexAutoescape);
    }

    // Overrides
    {
        fs::path absoluteOut = testRoot / "public";
        WriteConfig(testRoot,
            "{\n"
            "  \"markdown_dir\": \"content\",\n"
            "  \"output_dir\": \"" + absoluteOut.generic_string() + "\",\n"
            "  \"index_template\": \"home.html\",\n"
            "  \"site_title\": \"Notes\",\n"
            "  \"log_level\": \"debug\",\n"
            "  \"strict_dates\": false,\n"
            "  \"sort_documents\": false,\n"
            "  \"allow_unsafe_names\": true,\n"
            "  \"index_autoescape\": false,\n"
            "  \"unknown_key\": 42\n"
            "}\n");
        auto config = infrastructure::ConfigLoader::Load(testRoot.string());
        assert(config.markdownDir == (testRoot / "content").string());
        assert(fs::path(config.outputDir) == absoluteOut);
        assert(config.indexTemplate == "home.html");
        assert(config.siteTitle == "Notes");
        assert(config.logLevel == infrastructure::LogLevel::Debug);
        assert(!config.strictDates);
        assert(!config.sortDocuments);
        assert(config.allowUnsafeNames);
        assert(!config.indexAutoescape);
        assert(config.templateDir == (testRoot / "src/templates").string());
    }

    // Malformed JSON, wrong types and bad levels are fatal
    WriteConfig(testRoot, "{ \"output_dir\": ");
    assert(LoadFails(testRoot));
    WriteConfig(testRoot, "{ \"strict_dates\": \"yes\" }");
    assert(LoadFails(testRoot));
    WriteConfig(testRoot, "{ \"log_level\": \"loud\" }");
    assert(LoadFails(testRoot));
    WriteConfig(testRoot, "[1, 2, 3]");
    assert(LoadFails(testRoot));

    assert(infrastructure::Logger::ParseLevel("WARN") == infrastructure::LogLevel::Warning);
    assert(!infrastructure::Logger::ParseLevel("verbose"));

    fs::remove_all(testRoot);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
