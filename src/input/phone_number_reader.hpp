
#ifndef PHONECODE_INPUT_PHONE_NUMBER_READER_HPP
#define PHONECODE_INPUT_PHONE_NUMBER_READER_HPP

#include <istream>
#include <string>
#include <vector>

#include "base/logger.hpp"
#include "input/phone_number_reader_error.hpp"

namespace phonecode::input {

  /**
   * Reads a list of phone numbers, one per line. A phone number is made of
   * digits, dashes and slashes; other lines are reported and skipped.
   */
  class PhoneNumberReader {
   public:
    static constexpr size_t kDefaultMaxNumberLength = 50;

    explicit PhoneNumberReader(size_t max_number_length = kDefaultMaxNumberLength);

    outcome::result<std::vector<std::string>> read(std::istream &input) const;

    outcome::result<std::vector<std::string>> readFile(
        const std::string &path) const;

    /**
     * @return true if the line may be passed to the encoder
     */
    bool isValidNumber(const std::string &number) const;

   private:
    size_t max_number_length_;
    base::Logger logger_ = base::createLogger("PhoneNumberReader");
  };

}  // namespace phonecode::input

#endif  // PHONECODE_INPUT_PHONE_NUMBER_READER_HPP
