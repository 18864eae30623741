
#include "input/phone_number_reader.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>

#include "testutil/outcome.hpp"

using phonecode::input::PhoneNumberReader;
using phonecode::input::PhoneNumberReaderError;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

/**
 * @given list with blank lines, CRLF endings and lines that are not numbers
 * @when it is read
 * @then only the phone numbers are returned, trimmed, in input order
 */
TEST(PhoneNumberReader, ReadsNumbers) {
  std::istringstream input(
      "112\n\n5624-82\r\n  10/783--5  \nabc\n4-8-2-4 x\n381482\n");
  PhoneNumberReader reader;

  EXPECT_OUTCOME_TRUE(numbers, reader.read(input));
  EXPECT_THAT(numbers, ElementsAre("112", "5624-82", "10/783--5", "381482"));
}

TEST(PhoneNumberReader, EmptyInput) {
  std::istringstream input("");
  PhoneNumberReader reader;

  EXPECT_OUTCOME_TRUE(numbers, reader.read(input));
  EXPECT_THAT(numbers, IsEmpty());
}

/**
 * @given reader accepting at most 5 digits
 * @when numbers are checked
 * @then only digits count against the length
 */
TEST(PhoneNumberReader, LengthLimit) {
  PhoneNumberReader reader(5);
  EXPECT_TRUE(reader.isValidNumber("12345"));
  EXPECT_TRUE(reader.isValidNumber("1-2/3"));
  EXPECT_TRUE(reader.isValidNumber("1-2-3/4-5"));
  EXPECT_FALSE(reader.isValidNumber("123456"));
  EXPECT_FALSE(reader.isValidNumber("1-23-456"));
  EXPECT_FALSE(reader.isValidNumber(""));
}

/**
 * @given reader accepting at most 12 digits
 * @when a list with an 11 digit number written with separators is read
 * @then the number is kept although it has 13 characters
 */
TEST(PhoneNumberReader, SeparatorsDoNotCount) {
  std::istringstream input("0721/608-4067\n");
  PhoneNumberReader reader(12);

  EXPECT_OUTCOME_TRUE(numbers, reader.read(input));
  EXPECT_THAT(numbers, ElementsAre("0721/608-4067"));
}

TEST(PhoneNumberReader, MissingFile) {
  PhoneNumberReader reader;
  EXPECT_EC(reader.readFile("/nonexistent/phonecode/numbers.txt"),
            PhoneNumberReaderError::FILE_NOT_FOUND);
}
