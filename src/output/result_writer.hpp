
#ifndef PHONECODE_OUTPUT_RESULT_WRITER_HPP
#define PHONECODE_OUTPUT_RESULT_WRITER_HPP

#include <ostream>
#include <vector>

#include "encoding/encoded_number.hpp"

namespace phonecode::output {

  /**
   * Prints encodings, one "<number>: <encoding>" line each
   */
  class ResultWriter {
   public:
    explicit ResultWriter(std::ostream &out) : out_{out} {}

    /**
     * @return number of lines written
     */
    size_t write(const std::vector<encoding::EncodedNumber> &encoded_numbers);

   private:
    std::ostream &out_;
  };

}  // namespace phonecode::output

#endif  // PHONECODE_OUTPUT_RESULT_WRITER_HPP
