/**
 * @file Logger.cpp
 * @brief Implementation of Logger.
 */

#include "infrastructure/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <ostream>

namespace marksite::infrastructure {

namespace {

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

} // namespace

Logger::Logger(std::ostream& out, LogLevel level) : m_out(out), m_level(level) {}

void Logger::debug(const std::string& component, const std::string& message) {
    write(LogLevel::Debug, component, message);
}

void Logger::info(const std::string& component, const std::string& message) {
    write(LogLevel::Info, component, message);
}

void Logger::warning(const std::string& component, const std::string& message) {
    ++m_warnings;
    write(LogLevel::Warning, component, message);
}

void Logger::error(const std::string& component, const std::string& message) {
    write(LogLevel::Error, component, message);
}

void Logger::write(LogLevel level, const std::string& component, const std::string& message) {
    if (level < m_level) return;
    m_out << "[" << component << "] " << LevelName(level) << ": " << message << std::endl;
}

std::optional<LogLevel> Logger::ParseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return std::tolower(c); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    return std::nullopt;
}

} // namespace marksite::infrastructure
