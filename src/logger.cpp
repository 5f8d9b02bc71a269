/**
 * @file logger.cpp
 * @brief Implementation of the logging system
 */

#include "logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

LogLevel Logger::s_minLevel = LogLevel::INFO;
bool Logger::s_useColors = true;
std::mutex Logger::s_mutex;

Logger::LogStream::LogStream(LogStream&& other) noexcept
    : m_level(other.m_level), m_enabled(other.m_enabled), m_stream(std::move(other.m_stream)) {
    // The moved-from stream must not emit a second (empty) line
    other.m_enabled = false;
}

Logger::LogStream::~LogStream() {
    if (m_enabled) {
        Logger::write(m_level, m_stream.str());
    }
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return fallback;
}

void Logger::write(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    std::lock_guard<std::mutex> lock(s_mutex);
    std::ostream& out = (level >= LogLevel::ERROR) ? std::cerr : std::cout;

    out << std::put_time(&local, "%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << std::setfill(' ') << ' ';

    if (s_useColors) {
        switch (level) {
            case LogLevel::DEBUG:   out << "\033[36m[DEBUG]\033[0m "; break;
            case LogLevel::INFO:    out << "\033[32m[INFO]\033[0m "; break;
            case LogLevel::WARNING: out << "\033[33m[WARNING]\033[0m "; break;
            case LogLevel::ERROR:   out << "\033[31m[ERROR]\033[0m "; break;
        }
    } else {
        switch (level) {
            case LogLevel::DEBUG:   out << "[DEBUG] "; break;
            case LogLevel::INFO:    out << "[INFO] "; break;
            case LogLevel::WARNING: out << "[WARNING] "; break;
            case LogLevel::ERROR:   out << "[ERROR] "; break;
        }
    }

    out << message << std::endl;
}
