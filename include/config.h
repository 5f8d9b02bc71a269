#pragma once
#include <string>
#include <map>

/**
 * @brief INI-style key/value configuration
 *
 * Sections are written as `[Room]`, entries as `key = value`. Lines and
 * trailing text starting with `#` or `;` are comments. A Config is built
 * once at startup and handed to whatever needs it.
 */
class Config {
public:
    Config() = default;

    bool loadFromFile(const std::string& filepath);
    void loadFromString(const std::string& text);

    bool has(const std::string& section, const std::string& key) const;

    int getInt(const std::string& section, const std::string& key, int defaultValue = 0) const;
    float getFloat(const std::string& section, const std::string& key, float defaultValue = 0.0f) const;
    bool getBool(const std::string& section, const std::string& key, bool defaultValue = false) const;
    std::string getString(const std::string& section, const std::string& key, const std::string& defaultValue = "") const;

    void setString(const std::string& section, const std::string& key, const std::string& value);

private:
    void parseLine(std::string line, std::string& currentSection);
    const std::string* find(const std::string& section, const std::string& key) const;
    static std::string trim(const std::string& str);

    std::map<std::string, std::map<std::string, std::string>> m_data;
};
