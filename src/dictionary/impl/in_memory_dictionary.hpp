
#ifndef PHONECODE_DICTIONARY_IMPL_IN_MEMORY_DICTIONARY_HPP
#define PHONECODE_DICTIONARY_IMPL_IN_MEMORY_DICTIONARY_HPP

#include "dictionary/dictionary_lookup.hpp"

#include <functional>
#include <map>

#include "dictionary/dictionary_error.hpp"

namespace phonecode::dictionary {

  /**
   * Bounds applied while a dictionary is built
   */
  struct DictionaryLimits {
    size_t max_word_length = 50;
    size_t max_dictionary_size = 75000;
  };

  /**
   * Dictionary kept in memory, indexed by the digit string of each word
   */
  class InMemoryDictionary : public DictionaryLookup {
   public:
    explicit InMemoryDictionary(DictionaryLimits limits = {});

    ~InMemoryDictionary() override = default;

    const std::vector<std::string> &wordsFor(
        std::string_view digits) const override;

    size_t size() const override {
      return size_;
    }

    /**
     * Adds a word to the index. Adding a word that is already known
     * succeeds without changing the dictionary.
     * @param word word as it must be printed
     * @return error if the word cannot be encoded or a limit is reached
     */
    outcome::result<void> addWord(const std::string &word);

   private:
    DictionaryLimits limits_;
    std::map<std::string, std::vector<std::string>, std::less<>> index_;
    size_t size_ = 0;
  };

}  // namespace phonecode::dictionary

#endif  // PHONECODE_DICTIONARY_IMPL_IN_MEMORY_DICTIONARY_HPP
