
#ifndef PHONECODE_TEST_TESTUTIL_OUTCOME_HPP
#define PHONECODE_TEST_TESTUTIL_OUTCOME_HPP

#include <gtest/gtest.h>
#include "outcome/outcome.hpp"

/// expects the void result to be a success
#define EXPECT_OUTCOME_TRUE_1(expr)                                      \
  {                                                                      \
    auto &&_result = (expr);                                             \
    EXPECT_TRUE(_result) << "Line " << __LINE__ << ": "                  \
                         << _result.error().message();                   \
  }

/// declares val as the value of a successful result, fails the test otherwise
#define EXPECT_OUTCOME_TRUE(val, expr)                                   \
  auto &&_##val = (expr);                                                \
  ASSERT_TRUE(_##val) << "Line " << __LINE__ << ": "                     \
                      << _##val.error().message();                       \
  auto &&val = _##val.value();

/// declares val as the error of a failed result, fails the test otherwise
#define EXPECT_OUTCOME_FALSE(val, expr)                                  \
  auto &&_##val = (expr);                                                \
  ASSERT_FALSE(_##val) << "Line " << __LINE__ << ": unexpected success"; \
  auto &&val = _##val.error();

/// expects the result to hold the given error code enum value
#define EXPECT_EC(expr, code)                                            \
  {                                                                      \
    auto &&_result = (expr);                                             \
    ASSERT_FALSE(_result) << "Line " << __LINE__ << ": unexpected success"; \
    EXPECT_EQ(_result.error(), make_error_code(code));                   \
  }

#endif  // PHONECODE_TEST_TESTUTIL_OUTCOME_HPP
