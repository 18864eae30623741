
#ifndef PHONECODE_ENCODING_ENCODER_ERROR_HPP
#define PHONECODE_ENCODING_ENCODER_ERROR_HPP

#include "outcome/outcome.hpp"

namespace phonecode::encoding {

  /**
   * @brief EncoderError enum provides error codes for NumberEncoder methods
   */
  enum class EncoderError {  // 0 is reserved for success
    INVALID_ARGUMENT = 1,    ///< no number was passed
    NUMBER_TOO_LONG,         ///< number has more digits than allowed
  };

}  // namespace phonecode::encoding

OUTCOME_HPP_DECLARE_ERROR_2(phonecode::encoding, EncoderError)

#endif  // PHONECODE_ENCODING_ENCODER_ERROR_HPP
