/**
 * @file config.cpp
 * @brief INI parsing and typed lookups
 */

#include "config.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

bool Config::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        Logger::warning() << "Failed to open config file: " << filepath;
        return false;
    }

    std::string currentSection;
    std::string line;
    while (std::getline(file, line)) {
        parseLine(line, currentSection);
    }

    Logger::info() << "Loaded config from " << filepath;
    return true;
}

void Config::loadFromString(const std::string& text) {
    std::istringstream stream(text);
    std::string currentSection;
    std::string line;
    while (std::getline(stream, line)) {
        parseLine(line, currentSection);
    }
}

void Config::parseLine(std::string line, std::string& currentSection) {
    line = trim(line);

    if (line.empty() || line[0] == '#' || line[0] == ';') {
        return;
    }

    if (line.front() == '[' && line.back() == ']') {
        currentSection = trim(line.substr(1, line.length() - 2));
        return;
    }

    size_t equalPos = line.find('=');
    if (equalPos == std::string::npos) {
        Logger::warning() << "Ignoring malformed config line: " << line;
        return;
    }

    std::string key = trim(line.substr(0, equalPos));
    std::string value = trim(line.substr(equalPos + 1));

    size_t commentPos = value.find_first_of("#;");
    if (commentPos != std::string::npos) {
        value = trim(value.substr(0, commentPos));
    }

    if (!currentSection.empty() && !key.empty()) {
        m_data[currentSection][key] = value;
    }
}

const std::string* Config::find(const std::string& section, const std::string& key) const {
    auto sectionIt = m_data.find(section);
    if (sectionIt == m_data.end()) {
        return nullptr;
    }
    auto keyIt = sectionIt->second.find(key);
    if (keyIt == sectionIt->second.end()) {
        return nullptr;
    }
    return &keyIt->second;
}

bool Config::has(const std::string& section, const std::string& key) const {
    return find(section, key) != nullptr;
}

int Config::getInt(const std::string& section, const std::string& key, int defaultValue) const {
    const std::string* value = find(section, key);
    if (value) {
        try {
            return std::stoi(*value);
        } catch (const std::exception&) {
            Logger::warning() << "Failed to parse int for [" << section << "]:" << key;
        }
    }
    return defaultValue;
}

float Config::getFloat(const std::string& section, const std::string& key, float defaultValue) const {
    const std::string* value = find(section, key);
    if (value) {
        try {
            return std::stof(*value);
        } catch (const std::exception&) {
            Logger::warning() << "Failed to parse float for [" << section << "]:" << key;
        }
    }
    return defaultValue;
}

bool Config::getBool(const std::string& section, const std::string& key, bool defaultValue) const {
    const std::string* value = find(section, key);
    if (!value) {
        return defaultValue;
    }

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") return false;

    Logger::warning() << "Failed to parse bool for [" << section << "]:" << key;
    return defaultValue;
}

std::string Config::getString(const std::string& section, const std::string& key, const std::string& defaultValue) const {
    const std::string* value = find(section, key);
    return value ? *value : defaultValue;
}

void Config::setString(const std::string& section, const std::string& key, const std::string& value) {
    m_data[section][key] = value;
}

std::string Config::trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}
