//
// Copyright (C) 2026 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "rangeio/result/expect.h"

#include <stdlib.h>

#include <optional>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "rangeio/result/result_matchers.h"
#include "rangeio/result/result_type.h"

namespace rangeio {
namespace {

using ::testing::AllOf;
using ::testing::HasSubstr;
using ::testing::Not;

Result<int> Fail() { return RANGEIO_ERR("inner failure " << 7); }

Result<int> Succeed() { return 5; }

Result<int> Propagate(bool fail) {
  int value = RANGEIO_EXPECT(fail ? Fail() : Succeed(), "outer context");
  return value + 1;
}

Result<void> CheckPositive(int value) {
  RANGEIO_EXPECT_GT(value, 0, "for value " << value);
  return {};
}

Result<std::string> FromOptional(std::optional<std::string> value) {
  return RANGEIO_EXPECT(std::move(value), "missing value");
}

TEST(ResultTest, ExpectPassesValue) {
  EXPECT_THAT(Propagate(false), IsOkAndValue(6));
}

TEST(ResultTest, ExpectAddsStackEntry) {
  Result<int> result = Propagate(true);

  ASSERT_THAT(result, IsError());
  ASSERT_EQ(result.error().Stack().size(), 2);
  EXPECT_EQ(result.error().Stack()[0].Message(), "inner failure 7");
  EXPECT_EQ(result.error().Stack()[1].Message(), "outer context");
}

TEST(ResultTest, MessageListsOuterFirst) {
  Result<int> result = Propagate(true);

  EXPECT_THAT(result, IsErrorAndMessage("outer context\ninner failure 7"));
}

TEST(ResultTest, CompareExpect) {
  EXPECT_THAT(CheckPositive(1), IsOk());
  EXPECT_THAT(CheckPositive(-2),
              IsErrorAndMessage(AllOf(HasSubstr("but was -2 vs 0"),
                                      HasSubstr("for value -2"))));
}

TEST(ResultTest, ExpectOptional) {
  EXPECT_THAT(FromOptional("x"), IsOkAndValue("x"));
  EXPECT_THAT(FromOptional(std::nullopt),
              IsErrorAndMessage(HasSubstr("missing value")));
}

TEST(ResultTest, TraceHasLocation) {
  Result<int> result = Propagate(true);

  ASSERT_THAT(result, IsError());
  EXPECT_THAT(result.error().Trace(), HasSubstr("result_test.cc"));
  EXPECT_THAT(result.error().Trace(), HasSubstr("Propagate"));
}

TEST(ResultTest, EnvironmentSelectsFormat) {
  Result<int> result = Propagate(true);
  ASSERT_THAT(result, IsError());

  ASSERT_EQ(setenv("RANGEIO_ERROR_FORMAT", "m", 1), 0);
  EXPECT_EQ(result.error().FormatForEnv(false),
            "outer context\ninner failure 7");

  ASSERT_EQ(unsetenv("RANGEIO_ERROR_FORMAT"), 0);
  EXPECT_THAT(result.error().FormatForEnv(false),
              AllOf(HasSubstr("result_test.cc"), HasSubstr("inner failure 7"),
                    Not(HasSubstr("\033["))));
}

TEST(ResultTest, ErrorFormatRejectsBraces) {
  ASSERT_EQ(setenv("RANGEIO_ERROR_FORMAT", "m}", 1), 0);
  EXPECT_EQ(ResultErrorFormat(false), "{:v}");
  ASSERT_EQ(unsetenv("RANGEIO_ERROR_FORMAT"), 0);
}

}  // namespace
}  // namespace rangeio
