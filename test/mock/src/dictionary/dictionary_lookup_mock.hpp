
#ifndef PHONECODE_DICTIONARY_LOOKUP_MOCK_HPP
#define PHONECODE_DICTIONARY_LOOKUP_MOCK_HPP

#include "dictionary/dictionary_lookup.hpp"

#include <gmock/gmock.h>

namespace phonecode::dictionary {
  class DictionaryLookupMock : public DictionaryLookup {
   public:
    MOCK_CONST_METHOD1(wordsFor,
                       const std::vector<std::string> &(std::string_view));

    MOCK_CONST_METHOD0(size, size_t());
  };
}  // namespace phonecode::dictionary

#endif  // PHONECODE_DICTIONARY_LOOKUP_MOCK_HPP
