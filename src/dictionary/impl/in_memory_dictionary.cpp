
#include "dictionary/impl/in_memory_dictionary.hpp"

#include <algorithm>
#include <cctype>

#include "mapping/digit_letter_mapping.hpp"

namespace phonecode::dictionary {

  namespace {
    bool isForbidden(char c) {
      auto uc = static_cast<unsigned char>(c);
      return uc >= 0x80 || std::isdigit(uc) || std::isspace(uc)
          || std::iscntrl(uc);
    }
  }  // namespace

  InMemoryDictionary::InMemoryDictionary(DictionaryLimits limits)
      : limits_{limits} {}

  const std::vector<std::string> &InMemoryDictionary::wordsFor(
      std::string_view digits) const {
    static const std::vector<std::string> kNoWords;
    auto it = index_.find(digits);
    if (it == index_.end()) {
      return kNoWords;
    }
    return it->second;
  }

  outcome::result<void> InMemoryDictionary::addWord(const std::string &word) {
    if (std::any_of(word.begin(), word.end(), isForbidden)) {
      return DictionaryError::INVALID_CHARACTER;
    }
    auto digits = mapping::wordToDigits(word);
    if (!digits) {
      return DictionaryError::EMPTY_WORD;
    }
    if (digits->size() > limits_.max_word_length) {
      return DictionaryError::WORD_TOO_LONG;
    }

    auto &words = index_[*digits];
    auto pos = std::lower_bound(words.begin(), words.end(), word);
    if (pos != words.end() && *pos == word) {
      return outcome::success();
    }
    if (size_ >= limits_.max_dictionary_size) {
      if (words.empty()) {
        index_.erase(*digits);
      }
      return DictionaryError::DICTIONARY_FULL;
    }
    words.insert(pos, word);
    ++size_;
    return outcome::success();
  }

}  // namespace phonecode::dictionary
