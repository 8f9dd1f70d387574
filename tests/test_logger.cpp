#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>
#include "../src/CacheConfig.hpp"
#include "../src/Logger.hpp"

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/cachelayer-logs-XXXXXX";
        char * dir = mkdtemp(tmpl);
        ASSERT_NE(dir, nullptr);
        directory = dir;
        Logger::getInstance().setLogPath(directory + "/");
    }

    void TearDown() override {
        Logger::getInstance().setLogPath("");
        Logger::getInstance().setLevel(Logger::INFO);
        std::error_code ec;
        std::filesystem::remove_all(directory, ec);
    }

    std::string contents(const std::string & name) {
        std::ifstream in(directory + "/" + name);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::string directory;
};

TEST_F(LoggerTest, MessagesReachTheirFileAndMoreVerboseOnes) {
    Logger & logger = Logger::getInstance();
    logger.error(7, "disk full");
    logger.debug("just details");

    EXPECT_NE(contents("ERROR.log").find("[ERROR] 7: disk full"), std::string::npos);
    EXPECT_NE(contents("WARNING.log").find("7: disk full"), std::string::npos);
    EXPECT_NE(contents("INFO.log").find("7: disk full"), std::string::npos);
    EXPECT_NE(contents("DEBUG.log").find("7: disk full"), std::string::npos);

    EXPECT_NE(contents("DEBUG.log").find("just details"), std::string::npos);
    EXPECT_EQ(contents("INFO.log").find("just details"), std::string::npos);
}

TEST_F(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(Logger::parseLevel("debug"), Logger::DEBUG);
    EXPECT_EQ(Logger::parseLevel("Info"), Logger::INFO);
    EXPECT_EQ(Logger::parseLevel("WARN"), Logger::WARNING);
    EXPECT_EQ(Logger::parseLevel("error"), Logger::ERROR);
    EXPECT_THROW(Logger::parseLevel("verbose"), std::invalid_argument);
    EXPECT_STREQ(Logger::levelName(Logger::WARNING), "WARNING");
}

TEST_F(LoggerTest, ApplyLoggingSetsLevel) {
    CacheConfig config;
    config.logLevel = Logger::ERROR;
    applyLogging(config);
    EXPECT_EQ(Logger::getInstance().getLevel(), Logger::ERROR);
}

TEST_F(LoggerTest, UnwritablePathFallsBackToConsole) {
    Logger & logger = Logger::getInstance();
    logger.setLogPath("/proc/cachelayer-no-such-dir/");
    EXPECT_NO_THROW(logger.info("still logging"));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
