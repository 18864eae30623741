#ifndef PHONECODE_LOGGER_HPP
#define PHONECODE_LOGGER_HPP

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

#include "outcome/outcome.hpp"

namespace phonecode::base {
  enum class LoggerError {
    CANNOT_OPEN_LOG_FILE = 1
  };

  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @param basepath - log file to write to, stderr if empty
   * @return logger object
   */
  Logger createLogger(const std::string &tag, const std::string &basepath = "");

  /**
   * Set level of every logger created so far and of the ones created later
   * @param level - minimal level to be printed
   */
  void setLogLevel(spdlog::level::level_enum level);

  /**
   * Send loggers created from now on without a basepath to a file
   * @param path - log file, appended to
   * @return CANNOT_OPEN_LOG_FILE if the file cannot be opened for writing
   */
  outcome::result<void> setLogFile(const std::string &path);
}  // namespace phonecode::base

OUTCOME_HPP_DECLARE_ERROR_2(phonecode::base, LoggerError);

#endif  // PHONECODE_LOGGER_HPP
