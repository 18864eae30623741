
#include "encoding/impl/phone_number_encoder.hpp"

#include <algorithm>
#include <functional>
#include <iterator>

namespace phonecode::encoding {

  namespace {

    /**
     * Depth first search over the ways to split one digit buffer into
     * dictionary words and free digits. Segments are views into the buffer;
     * existence queries are memoised for the lifetime of the search.
     */
    class PartitionSearch {
     public:
      using Sink = std::function<void(std::string)>;

      PartitionSearch(const dictionary::DictionaryLookup &dictionary,
                      std::string_view digits)
          : dictionary_{dictionary},
            digits_{digits},
            encodable_{std::vector<Answer>(digits.size() + 1),
                       std::vector<Answer>(digits.size() + 1)},
            word_path_(digits.size() + 1) {}

      /**
       * Emits every complete encoding of the buffer to the sink
       * @return number of candidates dropped by the length check
       */
      size_t enumerate(const Sink &sink) {
        sink_ = &sink;
        rejected_ = 0;
        if (!digits_.empty() && hasEncoding(0, false)) {
          partition(0, false);
        }
        sink_ = nullptr;
        return rejected_;
      }

     private:
      enum class Answer : uint8_t { UNKNOWN, NO, YES };

      /// Either alternatives from the dictionary or one free digit
      struct Token {
        const std::vector<std::string> *words;
        char digit;
      };

      std::string_view segment(size_t begin, size_t end) const {
        return digits_.substr(begin, end - begin);
      }

      void partition(size_t start, bool previous_was_free_digit) {
        const size_t last = digits_.size() - 1;
        for (size_t current = start; current <= last; ++current) {
          const auto &words = dictionary_.wordsFor(segment(start, current + 1));
          const bool is_single_digit = current == start;

          if (current != last) {
            if (!words.empty()) {
              if (hasEncoding(current + 1, false)) {
                tokens_.push_back({&words, 0});
                partition(current + 1, false);
                tokens_.pop_back();
              }
            } else if (is_single_digit && !previous_was_free_digit
                       && !existsWordPath(start)) {
              if (hasEncoding(current + 1, true)) {
                tokens_.push_back({nullptr, digits_[start]});
                partition(current + 1, true);
                tokens_.pop_back();
              }
            }
          } else if (!words.empty()) {
            tokens_.push_back({&words, 0});
            emitEncodings();
            tokens_.pop_back();
          } else if (is_single_digit && !previous_was_free_digit) {
            tokens_.push_back({nullptr, digits_[start]});
            emitEncodings();
            tokens_.pop_back();
          }
        }
      }

      /// Same decisions as partition(), stops at the first complete encoding
      bool hasEncoding(size_t start, bool previous_was_free_digit) {
        if (start >= digits_.size()) {
          return false;
        }
        auto &answer = encodable_[previous_was_free_digit ? 1 : 0][start];
        if (answer != Answer::UNKNOWN) {
          return answer == Answer::YES;
        }

        const size_t last = digits_.size() - 1;
        bool found = false;
        for (size_t current = start; current <= last && !found; ++current) {
          const bool has_words =
              !dictionary_.wordsFor(segment(start, current + 1)).empty();
          const bool is_single_digit = current == start;

          if (current != last) {
            if (has_words) {
              found = hasEncoding(current + 1, false);
            } else if (is_single_digit && !previous_was_free_digit
                       && !existsWordPath(start)) {
              found = hasEncoding(current + 1, true);
            }
          } else {
            found = has_words || (is_single_digit && !previous_was_free_digit);
          }
        }
        answer = found ? Answer::YES : Answer::NO;
        return found;
      }

      /**
       * Lookahead: is there a word starting at start after which the rest
       * of the buffer can still be encoded. Longest words are tried first.
       */
      bool existsWordPath(size_t start) {
        auto &answer = word_path_[start];
        if (answer != Answer::UNKNOWN) {
          return answer == Answer::YES;
        }

        bool found = false;
        for (size_t end = digits_.size(); end > start && !found; --end) {
          if (dictionary_.wordsFor(segment(start, end)).empty()) {
            continue;
          }
          found = end == digits_.size() || hasEncoding(end, false);
        }
        answer = found ? Answer::YES : Answer::NO;
        return found;
      }

      void emitEncodings() {
        std::string text;
        text.reserve(digits_.size() * 2);
        expand(0, text);
      }

      /// Cartesian product of the token alternatives, leftmost token outermost
      void expand(size_t index, std::string &text) {
        if (index == tokens_.size()) {
          if (lettersAndDigitsCount(text) != digits_.size()) {
            ++rejected_;
            return;
          }
          (*sink_)(text);
          return;
        }

        const size_t mark = text.size();
        auto append = [&](std::string_view unit) {
          if (index != 0) {
            text.push_back(' ');
          }
          text.append(unit);
          expand(index + 1, text);
          text.resize(mark);
        };

        const auto &token = tokens_[index];
        if (token.words != nullptr) {
          for (const auto &word : *token.words) {
            append(word);
          }
        } else {
          append(std::string_view(&token.digit, 1));
        }
      }

      const dictionary::DictionaryLookup &dictionary_;
      std::string_view digits_;
      std::vector<Answer> encodable_[2];
      std::vector<Answer> word_path_;
      std::vector<Token> tokens_;
      const Sink *sink_ = nullptr;
      size_t rejected_ = 0;
    };

  }  // namespace

  PhoneNumberEncoder::PhoneNumberEncoder(
      std::shared_ptr<const dictionary::DictionaryLookup> dictionary,
      size_t max_number_length)
      : dictionary_{std::move(dictionary)},
        max_number_length_{max_number_length} {}

  outcome::result<std::vector<EncodedNumber>> PhoneNumberEncoder::encode(
      const std::string &number) const {
    std::vector<EncodedNumber> encoded_numbers;
    const auto digits = asciiDigits(number);
    if (digits.empty()) {
      logger_->debug("Number '{}' has no digits", number);
      return encoded_numbers;
    }
    if (digits.size() > max_number_length_) {
      logger_->warn("Number '{}' has {} digits, at most {} are allowed",
                    number,
                    digits.size(),
                    max_number_length_);
      return EncoderError::NUMBER_TOO_LONG;
    }

    PartitionSearch search(*dictionary_, digits);
    auto rejected = search.enumerate([&](std::string encoding) {
      encoded_numbers.emplace_back(number, std::move(encoding));
    });
    if (rejected != 0) {
      logger_->warn("Dropped {} encodings of '{}' with a wrong length",
                    rejected,
                    number);
    }
    logger_->debug("Number '{}' has {} encodings", number, encoded_numbers.size());
    return encoded_numbers;
  }

  std::string asciiDigits(std::string_view text) {
    std::string digits;
    digits.reserve(text.size());
    std::copy_if(text.begin(), text.end(), std::back_inserter(digits), [](char c) {
      return c >= '0' && c <= '9';
    });
    return digits;
  }

  size_t lettersAndDigitsCount(std::string_view text) {
    return static_cast<size_t>(
        std::count_if(text.begin(), text.end(), [](char c) {
          return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z')
              || (c >= 'A' && c <= 'Z');
        }));
  }

}  // namespace phonecode::encoding
