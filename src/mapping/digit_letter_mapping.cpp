
#include "mapping/digit_letter_mapping.hpp"

#include <array>

namespace phonecode::mapping {

  namespace {
    constexpr std::array<std::string_view, kDigitCount> kDigitLetters{
        "AV", "FMX", "BLT", "DKU", "CJW", "EN", "GOR", "HP", "IQ", "SYZ"};

    constexpr int8_t kNoDigit = -1;

    /// Letter 'A' + i -> digit, built once from kDigitLetters
    const std::array<int8_t, 26> &letterDigits() {
      static const std::array<int8_t, 26> table = [] {
        std::array<int8_t, 26> result{};
        result.fill(kNoDigit);
        for (uint8_t digit = 0; digit < kDigitCount; ++digit) {
          for (char letter : kDigitLetters[digit]) {
            result[letter - 'A'] = static_cast<int8_t>(digit);
          }
        }
        return result;
      }();
      return table;
    }

    char toUpper(char c) noexcept {
      return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
    }
  }  // namespace

  std::string_view lettersFor(uint8_t digit) noexcept {
    if (digit >= kDigitCount) {
      return {};
    }
    return kDigitLetters[digit];
  }

  std::optional<uint8_t> digitFor(char letter) noexcept {
    char upper = toUpper(letter);
    if (upper < 'A' || upper > 'Z') {
      return std::nullopt;
    }
    auto digit = letterDigits()[upper - 'A'];
    if (digit == kNoDigit) {
      return std::nullopt;
    }
    return static_cast<uint8_t>(digit);
  }

  std::optional<std::string> wordToDigits(std::string_view word) {
    std::string digits;
    digits.reserve(word.size());
    for (char c : word) {
      if (auto digit = digitFor(c)) {
        digits.push_back(static_cast<char>('0' + *digit));
      }
    }
    if (digits.empty()) {
      return std::nullopt;
    }
    return digits;
  }

}  // namespace phonecode::mapping
