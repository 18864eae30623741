
#ifndef PHONECODE_MAPPING_DIGIT_LETTER_MAPPING_HPP
#define PHONECODE_MAPPING_DIGIT_LETTER_MAPPING_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace phonecode::mapping {

  /// Number of digits in the encoding table
  constexpr uint8_t kDigitCount = 10;

  /**
   * @brief Letters encoded by a digit.
   *
   * Fixed table, case-insensitive on lookup, letters returned uppercase:
   * <pre>
   *  a v | f m x | b l t | d k u | c j w | e n | g o r | h p | i q | s y z
   *   0  |   1   |   2   |   3   |   4   |  5  |   6   |  7  |  8  |   9
   * </pre>
   * @param digit value in [0, 9]
   * @return uppercase letters of the digit, empty view for any other value
   */
  std::string_view lettersFor(uint8_t digit) noexcept;

  /**
   * @brief Digit encoding a letter
   * @param letter ASCII letter, either case
   * @return digit value or nullopt for non-letters
   */
  std::optional<uint8_t> digitFor(char letter) noexcept;

  /**
   * @brief Translates a dictionary word into the digit string it encodes.
   * Characters that are not letters (dashes, quotes) are skipped.
   * @param word dictionary word as written in the dictionary
   * @return digit characters '0'..'9', nullopt when the word has no letters
   */
  std::optional<std::string> wordToDigits(std::string_view word);

}  // namespace phonecode::mapping

#endif  // PHONECODE_MAPPING_DIGIT_LETTER_MAPPING_HPP
