
#ifndef PHONECODE_ENCODING_ENCODED_NUMBER_HPP
#define PHONECODE_ENCODING_ENCODED_NUMBER_HPP

#include <ostream>
#include <string>

namespace phonecode::encoding {

  /**
   * One accepted encoding of a phone number. The encoding is a sequence of
   * dictionary words and single digits separated by one space.
   */
  class EncodedNumber {
   public:
    EncodedNumber(std::string number, std::string encoding)
        : number_{std::move(number)}, encoding_{std::move(encoding)} {}

    /// Phone number exactly as it was given, separators included
    const std::string &number() const {
      return number_;
    }

    const std::string &encoding() const {
      return encoding_;
    }

    /**
     * @return printable line "<number>: <encoding>" without trailing spaces
     */
    std::string toString() const {
      return number_ + ": " + encoding_;
    }

    bool operator==(const EncodedNumber &other) const {
      return number_ == other.number_ && encoding_ == other.encoding_;
    }

    bool operator!=(const EncodedNumber &other) const {
      return !(*this == other);
    }

   private:
    std::string number_;
    std::string encoding_;
  };

  inline std::ostream &operator<<(std::ostream &out,
                                  const EncodedNumber &encoded) {
    return out << encoded.toString();
  }

}  // namespace phonecode::encoding

#endif  // PHONECODE_ENCODING_ENCODED_NUMBER_HPP
