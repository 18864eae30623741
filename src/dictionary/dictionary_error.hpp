
#ifndef PHONECODE_DICTIONARY_DICTIONARY_ERROR_HPP
#define PHONECODE_DICTIONARY_DICTIONARY_ERROR_HPP

#include "outcome/outcome.hpp"

namespace phonecode::dictionary {

  /**
   * Codes for errors that originate in dictionary building and loading
   */
  enum class DictionaryError {
    EMPTY_WORD = 1,     ///< word has no letter to encode
    INVALID_CHARACTER,  ///< word contains a digit, whitespace or non-ASCII
    WORD_TOO_LONG,      ///< word has more letters than allowed
    DICTIONARY_FULL,    ///< maximum number of words reached
    FILE_NOT_FOUND,     ///< dictionary file cannot be opened
    READ_FAILED         ///< stream error while reading words
  };

}  // namespace phonecode::dictionary

OUTCOME_HPP_DECLARE_ERROR_2(phonecode::dictionary, DictionaryError);

#endif  // PHONECODE_DICTIONARY_DICTIONARY_ERROR_HPP
