
#include "application/encoding_application.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "mock/src/application/app_config_mock.hpp"
#include "testutil/outcome.hpp"

using phonecode::application::AppConfigurationMock;
using phonecode::application::configureLogging;
using phonecode::application::EncodingApplication;
using phonecode::base::LoggerError;
using ::testing::Return;
using ::testing::ReturnRef;

class EncodingApplicationTest : public ::testing::Test {
 public:
  void SetUp() override {
    {
      std::ofstream file(dictionary_path_);
      file << "any\nw\ned\nd\"ug\nduo\nEi\n";
    }
    dictionary_file_ = dictionary_path_.string();

    ON_CALL(*config_, dictionary_path()).WillByDefault(ReturnRef(dictionary_file_));
    ON_CALL(*config_, input_path()).WillByDefault(ReturnRef(input_path_));
    ON_CALL(*config_, max_number_length()).WillByDefault(Return(50));
    ON_CALL(*config_, max_word_length()).WillByDefault(Return(50));
    ON_CALL(*config_, max_dictionary_size()).WillByDefault(Return(75000));
  }

  void TearDown() override {
    std::filesystem::remove(dictionary_path_);
  }

 protected:
  std::shared_ptr<::testing::NiceMock<AppConfigurationMock>> config_ =
      std::make_shared<::testing::NiceMock<AppConfigurationMock>>();
  std::filesystem::path dictionary_path_ =
      std::filesystem::temp_directory_path()
      / "phonecode_encoding_application_test.txt";
  std::string dictionary_file_;
  boost::optional<std::string> input_path_;
};

/**
 * @given dictionary file and phone numbers on the input stream
 * @when the application runs
 * @then every encoding of every number is printed in input order
 */
TEST_F(EncodingApplicationTest, PrintsEncodings) {
  std::istringstream in("059-4-5-3336\n77\n3586\n\n");
  std::ostringstream out;

  EncodingApplication app(config_, in, out);

  EXPECT_EQ(app.run(), 0);
  EXPECT_EQ(out.str(),
            "059-4-5-3336: any w ed d\"ug\n"
            "059-4-5-3336: any w ed duo\n"
            "3586: 3 Ei 6\n");
}

/**
 * @given number with more digits than allowed
 * @when the application runs
 * @then the number is skipped and the others are still encoded
 */
TEST_F(EncodingApplicationTest, SkipsTooLongNumbers) {
  ON_CALL(*config_, max_number_length()).WillByDefault(Return(4));
  std::istringstream in("0594\n05945\n3586\n");
  std::ostringstream out;

  EncodingApplication app(config_, in, out);

  EXPECT_EQ(app.run(), 0);
  EXPECT_EQ(out.str(), "0594: any w\n3586: 3 Ei 6\n");
}

TEST_F(EncodingApplicationTest, MissingDictionary) {
  std::string missing = "/nonexistent/phonecode/words.txt";
  ON_CALL(*config_, dictionary_path()).WillByDefault(ReturnRef(missing));
  std::istringstream in("3586\n");
  std::ostringstream out;

  EncodingApplication app(config_, in, out);

  EXPECT_EQ(app.run(), 1);
  EXPECT_TRUE(out.str().empty());
}

TEST_F(EncodingApplicationTest, MissingInputFile) {
  input_path_ = std::string("/nonexistent/phonecode/numbers.txt");
  std::istringstream in;
  std::ostringstream out;

  EncodingApplication app(config_, in, out);

  EXPECT_EQ(app.run(), 1);
}

/**
 * @given configuration naming a log file that cannot be opened
 * @when logging is configured from it
 * @then an error is returned so that the tool can exit with a message
 */
TEST_F(EncodingApplicationTest, UnopenableLogFile) {
  std::string log_file = "/proc/phonecode/phonecode.log";
  EXPECT_CALL(*config_, log_file()).WillRepeatedly(ReturnRef(log_file));

  EXPECT_OUTCOME_FALSE(error, configureLogging(*config_));
  EXPECT_EQ(error, make_error_code(LoggerError::CANNOT_OPEN_LOG_FILE));
}
