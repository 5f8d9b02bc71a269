/**
 * @file logger.h
 * @brief Stream-style logging shared by the server, the scheduler workers and the tools
 */

#pragma once

#include <sstream>
#include <string>
#include <mutex>

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Verbose debugging information
    INFO,     ///< General informational messages
    WARNING,  ///< Recoverable problems (bad config value, skipped data entry)
    ERROR     ///< Failures (data table missing, worker fault)
};

/**
 * @brief Thread-safe logger with severity levels and timestamps
 *
 * Chunk workers and the room thread log concurrently, so every line is
 * written under a single mutex and never interleaves.
 *
 * Usage:
 * @code
 * Logger::info() << "Loaded " << count << " quests from " << path;
 * Logger::error() << "Chunk (" << x << ", " << z << ") failed: " << e.what();
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Log stream that outputs when destroyed
     */
    class LogStream {
    public:
        explicit LogStream(LogLevel level) : m_level(level), m_enabled(level >= s_minLevel) {}
        LogStream(LogStream&& other) noexcept;
        ~LogStream();

        LogStream(const LogStream&) = delete;
        LogStream& operator=(const LogStream&) = delete;

        template<typename T>
        LogStream& operator<<(const T& value) {
            if (m_enabled) {
                m_stream << value;
            }
            return *this;
        }

    private:
        LogLevel m_level;
        bool m_enabled;
        std::ostringstream m_stream;
    };

    static LogStream debug() { return LogStream(LogLevel::DEBUG); }
    static LogStream info() { return LogStream(LogLevel::INFO); }
    static LogStream warning() { return LogStream(LogLevel::WARNING); }
    static LogStream error() { return LogStream(LogLevel::ERROR); }

    /**
     * @brief Sets the minimum level; messages below it are dropped
     */
    static void setMinLevel(LogLevel level) { s_minLevel = level; }
    static LogLevel minLevel() { return s_minLevel; }

    /**
     * @brief Enables or disables ANSI colour prefixes
     */
    static void setUseColors(bool enable) { s_useColors = enable; }

    /**
     * @brief Parses "debug", "info", "warning" or "error" (case-insensitive)
     * @param fallback Returned for unrecognized names
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

private:
    static void write(LogLevel level, const std::string& message);

    static LogLevel s_minLevel;
    static bool s_useColors;
    static std::mutex s_mutex;
};
