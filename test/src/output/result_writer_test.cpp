
#include "output/result_writer.hpp"

#include <gtest/gtest.h>

#include <sstream>

using phonecode::encoding::EncodedNumber;
using phonecode::output::ResultWriter;

/**
 * @given encodings of a number
 * @when they are written
 * @then one "<number>: <encoding>" line is printed per encoding
 */
TEST(ResultWriter, WritesOneLinePerEncoding) {
  std::ostringstream out;
  ResultWriter writer(out);

  auto written = writer.write({EncodedNumber("059-4-5-3336", "any w ed d\"ug"),
                               EncodedNumber("059-4-5-3336", "any w ed duo")});

  EXPECT_EQ(written, 2u);
  EXPECT_EQ(out.str(),
            "059-4-5-3336: any w ed d\"ug\n"
            "059-4-5-3336: any w ed duo\n");
}

TEST(ResultWriter, NothingToWrite) {
  std::ostringstream out;
  ResultWriter writer(out);

  EXPECT_EQ(writer.write({}), 0u);
  EXPECT_TRUE(out.str().empty());
}
