
#include "dictionary/dictionary_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(phonecode::dictionary, DictionaryError, e) {
  using E = phonecode::dictionary::DictionaryError;
  switch (e) {
    case E::EMPTY_WORD:
      return "Word contains no letters";
    case E::INVALID_CHARACTER:
      return "Word contains a character that cannot appear in a dictionary word";
    case E::WORD_TOO_LONG:
      return "Word exceeds the maximum word length";
    case E::DICTIONARY_FULL:
      return "Dictionary exceeds the maximum number of words";
    case E::FILE_NOT_FOUND:
      return "Dictionary file cannot be opened";
    case E::READ_FAILED:
      return "Dictionary could not be read completely";
  }
  return "Unknown error";
}
