
#include "input/phone_number_reader_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(phonecode::input, PhoneNumberReaderError, e) {
  using E = phonecode::input::PhoneNumberReaderError;
  switch (e) {
    case E::FILE_NOT_FOUND:
      return "Phone number list cannot be opened";
    case E::READ_FAILED:
      return "Phone number list could not be read";
  }
  return "Unknown error";
}
