
#ifndef PHONECODE_INPUT_PHONE_NUMBER_READER_ERROR_HPP
#define PHONECODE_INPUT_PHONE_NUMBER_READER_ERROR_HPP

#include "outcome/outcome.hpp"

namespace phonecode::input {

  enum class PhoneNumberReaderError {
    FILE_NOT_FOUND = 1,  ///< number list cannot be opened
    READ_FAILED          ///< stream went bad while reading
  };

}  // namespace phonecode::input

OUTCOME_HPP_DECLARE_ERROR_2(phonecode::input, PhoneNumberReaderError);

#endif  // PHONECODE_INPUT_PHONE_NUMBER_READER_ERROR_HPP
