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

#include "rangeio/io/string.h"

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "rangeio/context/context.h"
#include "rangeio/object/in_memory_object.h"
#include "rangeio/object/range_reader.h"
#include "rangeio/result/result_matchers.h"

namespace rangeio {
namespace {

TEST(StringTest, ReadToStringSmallBuffer) {
  InMemoryObject object("text", "a longer piece of text");
  auto reader = CreateSeekableRangeReader(Context(), object, 22);

  EXPECT_THAT(ReadToString(*reader, 4), IsOkAndValue("a longer piece of text"));
}

TEST(StringTest, ReadToStringZeroBuffer) {
  InMemoryObject object("text", "abc");
  auto reader = CreateSeekableRangeReader(Context(), object, 3);

  EXPECT_THAT(ReadToString(*reader, 0), IsError());
}

TEST(StringTest, StringWriterAppends) {
  StringWriter writer;

  EXPECT_THAT(writer.Write("abc", 3), IsOkAndValue(3));
  EXPECT_THAT(writer.Write("de", 2), IsOkAndValue(2));
  EXPECT_EQ(writer.Contents(), "abcde");
}

}  // namespace
}  // namespace rangeio
