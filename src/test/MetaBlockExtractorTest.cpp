#include <cassert>
#include <iostream>
#include <string>

#include "infrastructure/MetaBlockExtractor.hpp"

using namespace marksite;

int main() {
    std::cout << "[Test] Starting MetaBlockExtractor Test..." << std::endl;
    infrastructure::MetaBlockExtractor extractor;

    // Header with arbitrary keys, mixed case and continuation lines
    {
        std::string text =
            "Title: Hello World\n"
            "Date: 2024-01-15\n"
            "Tags: one\n"
            "    two\n"
            "author_name:   Ana  \n"
            "\n"
            "# Heading\n"
            "Body text.\n";
        auto result = extractor.extract(text);
        assert(result.metadata.size() == 4);
        assert(*domain::FirstValue(result.metadata, "title") == "Hello World");
        assert(*domain::FirstValue(result.metadata, "date") == "2024-01-15");
        assert(result.metadata.at("tags").size() == 2);
        assert(result.metadata.at("tags")[1] == "two");
        assert(*domain::FirstValue(result.metadata, "author_name") == "Ana");
        assert(result.body == "# Heading\nBody text.\n");
    }

    // Repeated key keeps every value; first one wins for lookups
    {
        auto result = extractor.extract("title: First\ntitle: Second\n\nText");
        assert(result.metadata.at("title").size() == 2);
        assert(*domain::FirstValue(result.metadata, "title") == "First");
        assert(result.body == "Text");
    }

    // No header: text returned untouched
    {
        std::string text = "# Just a heading\n\nSome *markdown*.\n";
        auto result = extractor.extract(text);
        assert(result.metadata.empty());
        assert(result.body == text);
        assert(domain::FirstValue(result.metadata, "title") == nullptr);
    }

    // YAML-style delimiters
    {
        auto result = extractor.extract("---\ntitle: Fenced\ndate: March 3, 2023\n---\nContent\n");
        assert(*domain::FirstValue(result.metadata, "title") == "Fenced");
        assert(*domain::FirstValue(result.metadata, "date") == "March 3, 2023");
        assert(result.body == "Content\n");
    }

    // Header closed by a line that is not metadata; that line stays in the body
    {
        auto result = extractor.extract("title: Abrupt\nThis is prose.\nMore prose.");
        assert(*domain::FirstValue(result.metadata, "title") == "Abrupt");
        assert(result.body == "This is prose.\nMore prose.");
    }

    // Empty value is kept as an empty string
    {
        auto result = extractor.extract("date:\ntitle:\n\nx");
        assert(domain::FirstValue(result.metadata, "date")->empty());
        assert(domain::FirstValue(result.metadata, "title")->empty());
    }

    // CRLF line endings
    {
        auto result = extractor.extract("title: Windows\r\n\r\nBody\r\n");
        assert(*domain::FirstValue(result.metadata, "title") == "Windows");
        assert(result.body == "Body\r\n");
    }

    // Tab-indented continuation lines count like four spaces
    {
        auto result = extractor.extract("title: A\n\ttabbed continuation\ndate:\t2024-01-15\n\nB");
        assert(result.metadata.at("title").size() == 2);
        assert(result.metadata.at("title")[1] == "tabbed continuation");
        assert(*domain::FirstValue(result.metadata, "date") == "2024-01-15");
        assert(result.body == "B");
    }

    // Four leading spaces is a continuation, never a key
    {
        auto result = extractor.extract("    indented: code\n\nText");
        assert(result.metadata.empty());
        assert(result.body == "    indented: code\n\nText");
    }

    std::cout << "[PASS] MetaBlockExtractor Test." << std::endl;
    return 0;
}
