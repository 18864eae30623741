
#include "output/result_writer.hpp"

namespace phonecode::output {

  size_t ResultWriter::write(
      const std::vector<encoding::EncodedNumber> &encoded_numbers) {
    for (const auto &encoded : encoded_numbers) {
      out_ << encoded.toString() << '\n';
    }
    out_.flush();
    return encoded_numbers.size();
  }

}  // namespace phonecode::output
