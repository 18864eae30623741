
#include "base/logger.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>

#include "testutil/outcome.hpp"

using phonecode::base::createLogger;
using phonecode::base::LoggerError;
using phonecode::base::setLogFile;

/**
 * @given path whose directory cannot be created
 * @when it is set as log file
 * @then an error is returned instead of an exception
 */
TEST(Logger, UnopenableLogFile) {
  EXPECT_OUTCOME_FALSE(error, setLogFile("/proc/phonecode/phonecode.log"));
  EXPECT_EQ(error, make_error_code(LoggerError::CANNOT_OPEN_LOG_FILE));
}

/**
 * @given writable log file
 * @when a logger is created after setting it
 * @then messages of the logger land in the file
 */
TEST(Logger, LoggersCreatedLaterWriteToLogFile) {
  auto path =
      std::filesystem::temp_directory_path() / "phonecode_logger_test.log";
  std::filesystem::remove(path);

  EXPECT_OUTCOME_TRUE_1(setLogFile(path.string()));
  auto logger = createLogger("LoggerTest");
  logger->error("written to the log file");
  logger->flush();

  std::ifstream file(path);
  std::string content{std::istreambuf_iterator<char>(file),
                      std::istreambuf_iterator<char>()};
  EXPECT_NE(content.find("[LoggerTest] written to the log file"),
            std::string::npos);
}
