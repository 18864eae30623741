
#ifndef PHONECODE_DICTIONARY_DICTIONARY_LOADER_HPP
#define PHONECODE_DICTIONARY_DICTIONARY_LOADER_HPP

#include <istream>
#include <memory>

#include "base/logger.hpp"
#include "dictionary/impl/in_memory_dictionary.hpp"

namespace phonecode::dictionary {

  /**
   * Reads a word list, one word per line, into an InMemoryDictionary.
   * Blank lines are skipped, words that cannot be encoded are reported and
   * skipped, exceeding the dictionary size aborts loading.
   */
  class DictionaryLoader {
   public:
    explicit DictionaryLoader(DictionaryLimits limits = {});

    outcome::result<std::shared_ptr<InMemoryDictionary>> load(
        std::istream &input) const;

    outcome::result<std::shared_ptr<InMemoryDictionary>> loadFile(
        const std::string &path) const;

   private:
    DictionaryLimits limits_;
    base::Logger logger_ = base::createLogger("DictionaryLoader");
  };

}  // namespace phonecode::dictionary

#endif  // PHONECODE_DICTIONARY_DICTIONARY_LOADER_HPP
