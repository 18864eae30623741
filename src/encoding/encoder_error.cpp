
#include "encoding/encoder_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(phonecode::encoding, EncoderError, e) {
  using phonecode::encoding::EncoderError;
  switch (e) {
    case EncoderError::INVALID_ARGUMENT:
      return "null phone number passed to encoder";
    case EncoderError::NUMBER_TOO_LONG:
      return "phone number has too many digits";
  }
  return "unknown EncoderError";
}
