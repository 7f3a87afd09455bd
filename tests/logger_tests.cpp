#include "spvmerkle/errors.hpp"
#include "spvmerkle/logger.h"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <cstdio> // For std::remove
#include <fstream>
#include <string>
#include <vector>

using namespace spvmerkle;

namespace {
std::string readFileContents(const std::string &path) {
  std::ifstream ifs(path);
  if (!ifs) {
    return "";
  }
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

int countOccurrences(const std::string &text, const std::string &sub) {
  int count = 0;
  size_t pos = text.find(sub, 0);
  while (pos != std::string::npos) {
    count++;
    pos = text.find(sub, pos + sub.length());
  }
  return count;
}
} // namespace

class LoggerTest : public ::testing::Test {
protected:
  std::vector<std::string> files_to_remove_;

  void TearDown() override {
    // Point the singleton back at the suite log to release test file handles.
    Logger::init(spvmerkle::test::suiteLogPath(), LogLevel::DEBUG);
    for (const auto &file : files_to_remove_) {
      std::remove(file.c_str());
    }
    files_to_remove_.clear();
  }

  void addFileForCleanup(const std::string &filename) {
    files_to_remove_.push_back(filename);
  }
};

TEST_F(LoggerTest, LogLevelFiltering) {
  const std::string testLogFile = "test_level_filter.log";
  addFileForCleanup(testLogFile);
  std::remove(testLogFile.c_str());

  ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::INFO));
  Logger &logger = Logger::getInstance();

  logger.log(LogLevel::TRACE, "This is a trace message.");
  logger.log(LogLevel::DEBUG, "This is a debug message.");
  logger.log(LogLevel::INFO, "This is an info message.");
  logger.log(LogLevel::WARN, "This is a warning message.");
  logger.log(LogLevel::ERROR, "This is an error message.");

  std::string logContents = readFileContents(testLogFile);
  ASSERT_NE(logContents, "");
  EXPECT_EQ(countOccurrences(logContents, "This is a trace message."), 0);
  EXPECT_EQ(countOccurrences(logContents, "This is a debug message."), 0);
  EXPECT_NE(logContents.find("This is an info message."), std::string::npos);
  EXPECT_NE(logContents.find("This is a warning message."), std::string::npos);
  EXPECT_NE(logContents.find("This is an error message."), std::string::npos);
}

TEST_F(LoggerTest, JsonOutputFormat) {
  const std::string testLogFile = "test_json_format.log";
  addFileForCleanup(testLogFile);
  std::remove(testLogFile.c_str());

  ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::DEBUG));
  Logger::getInstance().log(LogLevel::INFO,
                            "Special chars \" \\ \n \t in message");

  std::string logContents = readFileContents(testLogFile);
  ASSERT_FALSE(logContents.empty());
  EXPECT_NE(logContents.find("\"level\": \"INFO\""), std::string::npos);
  EXPECT_NE(
      logContents.find("\"message\": \"Special chars \\\" \\\\ \\n \\t in message\""),
      std::string::npos);
  EXPECT_NE(logContents.find("\"timestamp\": \""), std::string::npos);
  EXPECT_EQ(logContents.front(), '{');
  size_t last_char_pos = logContents.find_last_not_of("\n\r");
  ASSERT_NE(last_char_pos, std::string::npos);
  EXPECT_EQ(logContents[last_char_pos], '}');
}

TEST_F(LoggerTest, ControlCharactersAreEscaped) {
  const std::string testLogFile = "test_control_chars.log";
  addFileForCleanup(testLogFile);
  std::remove(testLogFile.c_str());

  ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::DEBUG));
  Logger::getInstance().log(LogLevel::INFO, "tree \x01 name \x1f end");

  std::string logContents = readFileContents(testLogFile);
  ASSERT_FALSE(logContents.empty());
  EXPECT_NE(logContents.find("tree \\u0001 name \\u001f end"),
            std::string::npos);
  std::string line = logContents.substr(0, logContents.find('\n'));
  for (char c : line) {
    EXPECT_GE(static_cast<unsigned char>(c), 0x20)
        << "raw control byte in log line";
  }
}

TEST_F(LoggerTest, RotatesAtMaxSize) {
  const std::string testLogFile = "test_rotation.log";
  addFileForCleanup(testLogFile);
  addFileForCleanup(testLogFile + ".1");
  addFileForCleanup(testLogFile + ".2");
  std::remove(testLogFile.c_str());
  std::remove((testLogFile + ".1").c_str());
  std::remove((testLogFile + ".2").c_str());

  ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::INFO, 200, 1));
  for (int i = 0; i < 20; ++i) {
    Logger::getInstance().log(LogLevel::INFO,
                              "rotation message " + std::to_string(i));
  }

  EXPECT_FALSE(readFileContents(testLogFile + ".1").empty());
  EXPECT_TRUE(readFileContents(testLogFile + ".2").empty());
  EXPECT_NE(readFileContents(testLogFile).find("rotation message 19"),
            std::string::npos);
}

TEST_F(LoggerTest, TreeErrorsAreLogged) {
  const std::string testLogFile = "test_tree_errors.log";
  addFileForCleanup(testLogFile);
  std::remove(testLogFile.c_str());

  ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::ERROR));
  EXPECT_THROW(ThrowCapacityError("too many leaves"), CapacityError);

  std::string logContents = readFileContents(testLogFile);
  EXPECT_NE(logContents.find("\"level\": \"ERROR\""), std::string::npos);
  EXPECT_NE(logContents.find("too many leaves"), std::string::npos);
}

TEST(LoggerLevels, ParseLevelNames) {
  EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
  EXPECT_EQ(Logger::parseLevel("WARN"), LogLevel::WARN);
  EXPECT_THROW(Logger::parseLevel("verbose"), ConfigError);
}
