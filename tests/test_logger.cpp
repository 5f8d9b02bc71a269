/**
 * @file test_logger.cpp
 * @brief Line format, level filtering and level parsing of the logger
 */

#include "test_utils.h"
#include "logger.h"
#include <cctype>
#include <sstream>
#include <string>

namespace {

/**
 * @brief Redirects std::cout into a buffer for the lifetime of the capture
 */
class CoutCapture {
public:
    CoutCapture() : m_previous(std::cout.rdbuf(m_buffer.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(m_previous); }

    std::string text() const { return m_buffer.str(); }

private:
    std::ostringstream m_buffer;
    std::streambuf* m_previous;
};

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

TEST(LineCarriesTimestampAndLevel) {
    Logger::setUseColors(false);
    Logger::setMinLevel(LogLevel::INFO);

    std::string line;
    {
        CoutCapture capture;
        Logger::info() << "Loaded " << 3 << " quests";
        line = capture.text();
    }

    // "HH:MM:SS.mmm [INFO] Loaded 3 quests\n"
    ASSERT_EQ(line.size(), std::string("00:00:00.000 [INFO] Loaded 3 quests\n").size());
    for (size_t i : {0, 1, 3, 4, 6, 7, 9, 10, 11}) {
        ASSERT_TRUE(isDigit(line[i]));
    }
    ASSERT_EQ(line[2], ':');
    ASSERT_EQ(line[5], ':');
    ASSERT_EQ(line[8], '.');
    ASSERT_EQ(line.substr(12), " [INFO] Loaded 3 quests\n");
}

TEST(MessagesBelowMinimumDropped) {
    Logger::setUseColors(false);
    Logger::setMinLevel(LogLevel::WARNING);

    std::string text;
    {
        CoutCapture capture;
        Logger::debug() << "tick";
        Logger::info() << "joined";
        Logger::warning() << "slow chunk";
        text = capture.text();
    }
    Logger::setMinLevel(LogLevel::INFO);

    ASSERT_EQ(text.find("tick"), std::string::npos);
    ASSERT_EQ(text.find("joined"), std::string::npos);
    ASSERT_NE(text.find("[WARNING] slow chunk"), std::string::npos);
}

TEST(ParseLevelNames) {
    ASSERT_TRUE(Logger::parseLevel("debug") == LogLevel::DEBUG);
    ASSERT_TRUE(Logger::parseLevel("INFO") == LogLevel::INFO);
    ASSERT_TRUE(Logger::parseLevel("Warn") == LogLevel::WARNING);
    ASSERT_TRUE(Logger::parseLevel("error") == LogLevel::ERROR);
    ASSERT_TRUE(Logger::parseLevel("verbose", LogLevel::ERROR) == LogLevel::ERROR);
}

int main() {
    try {
        run_all_tests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "TEST FAILURE: " << e.what() << std::endl;
        return 1;
    }
}
