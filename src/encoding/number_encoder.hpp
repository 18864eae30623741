
#ifndef PHONECODE_ENCODING_NUMBER_ENCODER_HPP
#define PHONECODE_ENCODING_NUMBER_ENCODER_HPP

#include <string>
#include <vector>

#include "encoding/encoded_number.hpp"
#include "encoding/encoder_error.hpp"

namespace phonecode::encoding {

  /**
   * Turns a number into every encoding the dictionary allows
   */
  class NumberEncoder {
   public:
    virtual ~NumberEncoder() = default;

    /**
     * Encode number with the dictionary of the encoder
     * @param number number to be encoded, may contain separators
     * @return all encodings of the number, empty if there is none, or error
     */
    virtual outcome::result<std::vector<EncodedNumber>> encode(
        const std::string &number) const = 0;

    /**
     * @param number null-terminated number, nullptr is rejected with
     * EncoderError::INVALID_ARGUMENT
     */
    outcome::result<std::vector<EncodedNumber>> encode(
        const char *number) const {
      if (number == nullptr) {
        return EncoderError::INVALID_ARGUMENT;
      }
      return encode(std::string(number));
    }
  };

}  // namespace phonecode::encoding

#endif  // PHONECODE_ENCODING_NUMBER_ENCODER_HPP
