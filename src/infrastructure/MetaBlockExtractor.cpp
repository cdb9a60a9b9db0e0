/**
 * @file MetaBlockExtractor.cpp
 * @brief Implementation of MetaBlockExtractor.
 */

#include "infrastructure/MetaBlockExtractor.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <vector>

namespace marksite::infrastructure {

namespace {

bool StartsWith(const std::string& text, const char* prefix) {
    return text.compare(0, std::string(prefix).length(), prefix) == 0;
}

std::string Trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

/// Replaces tabs with spaces up to the next multiple-of-four column.
std::string ExpandTabs(const std::string& line) {
    std::string result;
    for (char c : line) {
        if (c == '\t') {
            result.append(4 - result.size() % 4, ' ');
        } else {
            result += c;
        }
    }
    return result;
}

bool IsKeyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

/// Matches `   key: value`; returns the lower-cased key and the trimmed value.
std::optional<std::pair<std::string, std::string>> MatchKeyLine(const std::string& line) {
    size_t pos = 0;
    while (pos < line.size() && pos < 3 && line[pos] == ' ') ++pos;
    size_t keyStart = pos;
    while (pos < line.size() && IsKeyChar(line[pos])) ++pos;
    if (pos == keyStart || pos >= line.size() || line[pos] != ':') return std::nullopt;

    std::string key = line.substr(keyStart, pos - keyStart);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c){ return std::tolower(c); });
    return std::make_pair(key, Trim(line.substr(pos + 1)));
}

bool IsContinuationLine(const std::string& line) {
    return StartsWith(line, "    ");
}

} // namespace

domain::ExtractedDocument MetaBlockExtractor::extract(const std::string& text) const {
    std::vector<std::string> lines = SplitLines(text);
    size_t i = 0;
    bool opened = false;
    if (!lines.empty() && StartsWith(lines[0], "---")) {
        opened = true;
        ++i;
    }

    domain::Metadata metadata;
    std::string currentKey;
    while (i < lines.size()) {
        std::string line = ExpandTabs(lines[i]);
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (Trim(line).empty() || StartsWith(line, "---") || StartsWith(line, "...")) {
            ++i;
            break;
        }
        if (auto kv = MatchKeyLine(line)) {
            currentKey = kv->first;
            metadata[currentKey].push_back(kv->second);
            ++i;
            continue;
        }
        if (!currentKey.empty() && IsContinuationLine(line)) {
            metadata[currentKey].push_back(Trim(line));
            ++i;
            continue;
        }
        break;
    }

    if (metadata.empty() && !opened) {
        return {{}, text};
    }

    std::string body;
    for (size_t j = i; j < lines.size(); ++j) {
        body += lines[j];
        if (j + 1 < lines.size()) body += '\n';
    }
    return {metadata, body};
}

} // namespace marksite::infrastructure
