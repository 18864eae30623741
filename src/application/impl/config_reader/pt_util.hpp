
#ifndef PHONECODE_APPLICATION_UTIL_HPP
#define PHONECODE_APPLICATION_UTIL_HPP

#include "application/impl/config_reader/error.hpp"

namespace phonecode::application {

  /**
   * Value in [min, max] or INVALID_VALUE
   */
  template <typename T>
  outcome::result<T> ensureInRange(T value, T min, T max) {
    if (value < min || value > max) {
      return ConfigReaderError::INVALID_VALUE;
    }
    return value;
  }

}  // namespace phonecode::application

#endif  // PHONECODE_APPLICATION_UTIL_HPP
