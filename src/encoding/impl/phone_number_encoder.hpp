
#ifndef PHONECODE_ENCODING_IMPL_PHONE_NUMBER_ENCODER_HPP
#define PHONECODE_ENCODING_IMPL_PHONE_NUMBER_ENCODER_HPP

#include "encoding/number_encoder.hpp"

#include <memory>
#include <string_view>

#include "base/logger.hpp"
#include "dictionary/dictionary_lookup.hpp"

namespace phonecode::encoding {

  /**
   * @brief Encodes phone numbers with dictionary words.
   *
   * Encodings are built word by word from left to right. If and only if no
   * word of the dictionary can be inserted at a position (one that still
   * lets the rest of the number be encoded), the digit at that position is
   * copied to the encoding instead. Two subsequent digits are never allowed.
   * Only ASCII digits of the number take part in the encoding.
   */
  class PhoneNumberEncoder : public NumberEncoder {
   public:
    static constexpr size_t kDefaultMaxNumberLength = 50;

    explicit PhoneNumberEncoder(
        std::shared_ptr<const dictionary::DictionaryLookup> dictionary,
        size_t max_number_length = kDefaultMaxNumberLength);

    ~PhoneNumberEncoder() override = default;

    using NumberEncoder::encode;

    outcome::result<std::vector<EncodedNumber>> encode(
        const std::string &number) const override;

   private:
    std::shared_ptr<const dictionary::DictionaryLookup> dictionary_;
    size_t max_number_length_;
    base::Logger logger_ = base::createLogger("PhoneNumberEncoder");
  };

  /**
   * @return ASCII digits of the text in their original order
   */
  std::string asciiDigits(std::string_view text);

  /**
   * @return count of ASCII letters and digits of the text
   */
  size_t lettersAndDigitsCount(std::string_view text);

}  // namespace phonecode::encoding

#endif  // PHONECODE_ENCODING_IMPL_PHONE_NUMBER_ENCODER_HPP
