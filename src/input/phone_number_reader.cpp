
#include "input/phone_number_reader.hpp"

#include <algorithm>
#include <fstream>

#include <boost/algorithm/string/trim.hpp>

namespace phonecode::input {

  PhoneNumberReader::PhoneNumberReader(size_t max_number_length)
      : max_number_length_{max_number_length} {}

  bool PhoneNumberReader::isValidNumber(const std::string &number) const {
    auto is_digit = [](char c) { return c >= '0' && c <= '9'; };
    if (number.empty()
        || !std::all_of(number.begin(), number.end(), [&](char c) {
             return is_digit(c) || c == '-' || c == '/';
           })) {
      return false;
    }
    // separators do not count against the limit
    return static_cast<size_t>(
               std::count_if(number.begin(), number.end(), is_digit))
        <= max_number_length_;
  }

  outcome::result<std::vector<std::string>> PhoneNumberReader::read(
      std::istream &input) const {
    std::vector<std::string> numbers;
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
      ++line_number;
      boost::algorithm::trim(line);
      if (line.empty()) {
        continue;
      }
      if (!isValidNumber(line)) {
        logger_->warn("Skipping '{}' at line {}: not a phone number of at most {} digits",
                      line,
                      line_number,
                      max_number_length_);
        continue;
      }
      numbers.push_back(std::move(line));
    }
    if (input.bad()) {
      logger_->error("Reading phone numbers failed after line {}", line_number);
      return PhoneNumberReaderError::READ_FAILED;
    }
    logger_->debug("Read {} phone numbers", numbers.size());
    return numbers;
  }

  outcome::result<std::vector<std::string>> PhoneNumberReader::readFile(
      const std::string &path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
      logger_->error("Cannot open phone number list {}", path);
      return PhoneNumberReaderError::FILE_NOT_FOUND;
    }
    return read(file);
  }

}  // namespace phonecode::input
