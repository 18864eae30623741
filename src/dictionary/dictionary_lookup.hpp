
#ifndef PHONECODE_DICTIONARY_DICTIONARY_LOOKUP_HPP
#define PHONECODE_DICTIONARY_DICTIONARY_LOOKUP_HPP

#include <string>
#include <string_view>
#include <vector>

namespace phonecode::dictionary {

  /**
   * Finds dictionary words by the digit string their letters encode
   */
  class DictionaryLookup {
   public:
    virtual ~DictionaryLookup() = default;

    /**
     * Words encoding exactly the given digits
     * @param digits digit characters '0'..'9'
     * @return words as written in the dictionary, in a stable order; empty
     * collection when nothing matches
     */
    virtual const std::vector<std::string> &wordsFor(
        std::string_view digits) const = 0;

    /**
     * @return number of distinct words known
     */
    virtual size_t size() const = 0;
  };

}  // namespace phonecode::dictionary

#endif  // PHONECODE_DICTIONARY_DICTIONARY_LOOKUP_HPP
