/**
 * @file Logger.hpp
 * @brief Leveled log sink shared by the build pipeline.
 */

#pragma once
#include <iosfwd>
#include <optional>
#include <string>

namespace marksite::infrastructure {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @class Logger
 * @brief Writes "[Component] LEVEL: message" lines to a stream, dropping those below the threshold.
 *
 * Constructed once by the entry point and handed to the services that need it.
 */
class Logger {
public:
    explicit Logger(std::ostream& out, LogLevel level = LogLevel::Info);

    void setLevel(LogLevel level) { m_level = level; }
    LogLevel getLevel() const { return m_level; }

    void debug(const std::string& component, const std::string& message);
    void info(const std::string& component, const std::string& message);
    void warning(const std::string& component, const std::string& message);
    void error(const std::string& component, const std::string& message);

    /** @brief Number of warnings emitted so far (including filtered ones). */
    int warningCount() const { return m_warnings; }

    /** @brief Maps "debug", "info", "warning"/"warn", "error" to a level. */
    static std::optional<LogLevel> ParseLevel(const std::string& name);

private:
    void write(LogLevel level, const std::string& component, const std::string& message);

    std::ostream& m_out;
    LogLevel m_level;
    int m_warnings = 0;
};

} // namespace marksite::infrastructure
