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

#include "rangeio/io/copy.h"

#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "rangeio/context/context.h"
#include "rangeio/io/string.h"
#include "rangeio/object/in_memory_object.h"
#include "rangeio/object/range_reader.h"
#include "rangeio/result/result_matchers.h"

namespace rangeio {
namespace {

using ::testing::HasSubstr;

TEST(CopyTest, CopySmallBuffer) {
  InMemoryObject object("digits", "0123456789");
  auto reader = CreateSeekableRangeReader(Context(), object, 10);
  StringWriter out;

  EXPECT_THAT(Copy(*reader, out, 3), IsOkAndValue(10));
  EXPECT_EQ(out.Contents(), "0123456789");
}

TEST(CopyTest, CopyStartsAtSeekPosition) {
  InMemoryObject object("digits", "0123456789");
  auto reader = CreateSeekableRangeReader(Context(), object, 10);
  StringWriter out;

  ASSERT_THAT(reader->SeekSet(6), IsOk());
  EXPECT_THAT(Copy(*reader, out), IsOkAndValue(4));
  EXPECT_EQ(out.Contents(), "6789");
}

TEST(CopyTest, CopyNServesRange) {
  InMemoryObject object("digits", "0123456789");
  auto reader = CreateSeekableRangeReader(Context(), object, 10);
  StringWriter out;

  ASSERT_THAT(reader->SeekSet(2), IsOk());
  EXPECT_THAT(CopyN(*reader, out, 5, 2), IsOkAndValue(5));
  EXPECT_EQ(out.Contents(), "23456");
  EXPECT_EQ(reader->Position(), 7);
  EXPECT_EQ(reader->BytesRead(), 5);
}

TEST(CopyTest, CopyNPrematureEof) {
  InMemoryObject object("digits", "0123456789");
  auto reader = CreateSeekableRangeReader(Context(), object, 10);
  StringWriter out;

  ASSERT_THAT(reader->SeekSet(8), IsOk());
  EXPECT_THAT(CopyN(*reader, out, 5),
              IsErrorAndMessage(HasSubstr("after 2 of 5 bytes")));
  EXPECT_EQ(out.Contents(), "89");
}

TEST(CopyTest, CopyNZeroBytes) {
  InMemoryObject object("digits", "0123456789");
  auto reader = CreateSeekableRangeReader(Context(), object, 10);
  StringWriter out;

  EXPECT_THAT(CopyN(*reader, out, 0), IsOkAndValue(0));
  EXPECT_EQ(object.RangeReadersOpened(), 0);
}

}  // namespace
}  // namespace rangeio
