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

#include "rangeio/io/seek.h"

#include <stdint.h>
#include <stdio.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "rangeio/io/io.h"
#include "rangeio/result/result_matchers.h"
#include "rangeio/result/result_type.h"

namespace rangeio {
namespace {

using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::StrictMock;

class MockSeeker : public Seeker {
 public:
  MOCK_METHOD(Result<int64_t>, SeekSet, (int64_t), (override));
  MOCK_METHOD(Result<int64_t>, SeekCur, (int64_t), (override));
  MOCK_METHOD(Result<int64_t>, SeekEnd, (int64_t), (override));
};

TEST(SeekTest, DispatchesSet) {
  StrictMock<MockSeeker> seeker;
  EXPECT_CALL(seeker, SeekSet(7)).WillOnce(Return(Result<int64_t>(7)));

  EXPECT_THAT(Seek(seeker, 7, SEEK_SET), IsOkAndValue(7));
}

TEST(SeekTest, DispatchesCur) {
  StrictMock<MockSeeker> seeker;
  EXPECT_CALL(seeker, SeekCur(-3)).WillOnce(Return(Result<int64_t>(4)));

  EXPECT_THAT(Seek(seeker, -3, SEEK_CUR), IsOkAndValue(4));
}

TEST(SeekTest, DispatchesEnd) {
  StrictMock<MockSeeker> seeker;
  EXPECT_CALL(seeker, SeekEnd(-1)).WillOnce(Return(Result<int64_t>(99)));

  EXPECT_THAT(Seek(seeker, -1, SEEK_END), IsOkAndValue(99));
}

TEST(SeekTest, IllegalWhenceTouchesNothing) {
  StrictMock<MockSeeker> seeker;

  EXPECT_THAT(Seek(seeker, 0, 3),
              IsErrorAndMessage(HasSubstr("Illegal whence value 3")));
  EXPECT_THAT(Seek(seeker, 0, -1),
              IsErrorAndMessage(HasSubstr("Illegal whence value -1")));
}

TEST(SeekTest, WhenceFromString) {
  EXPECT_THAT(WhenceFromString("set"), IsOkAndValue(SEEK_SET));
  EXPECT_THAT(WhenceFromString("cur"), IsOkAndValue(SEEK_CUR));
  EXPECT_THAT(WhenceFromString("end"), IsOkAndValue(SEEK_END));
  EXPECT_THAT(WhenceFromString("middle"),
              IsErrorAndMessage(HasSubstr("Unknown whence 'middle'")));
}

}  // namespace
}  // namespace rangeio
