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

#include "rangeio/io/length.h"

#include <memory>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "rangeio/context/context.h"
#include "rangeio/object/in_memory_object.h"
#include "rangeio/object/range_reader.h"
#include "rangeio/result/result_matchers.h"

namespace rangeio {
namespace {

TEST(LengthTest, LengthEmpty) {
  InMemoryObject object("empty", std::vector<char>{});
  auto reader = CreateSeekableRangeReader(Context(), object, 0);

  ASSERT_THAT(Length(*reader), IsOkAndValue(0));
}

TEST(LengthTest, LengthWithData) {
  InMemoryObject object("data", std::vector<char>{1, 2, 3});
  auto reader = CreateSeekableRangeReader(Context(), object, 3);

  ASSERT_THAT(Length(*reader), IsOkAndValue(3));
}

TEST(LengthTest, ResetsSeekPos) {
  InMemoryObject object("data", std::vector<char>{1, 2, 3, 4, 5});
  auto reader = CreateSeekableRangeReader(Context(), object, 5);

  ASSERT_THAT(reader->SeekSet(2), IsOkAndValue(2));
  ASSERT_THAT(Length(*reader), IsOkAndValue(5));
  ASSERT_THAT(reader->SeekCur(0), IsOkAndValue(2));
  EXPECT_EQ(object.RangeReadersOpened(), 0);
}

}  // namespace
}  // namespace rangeio
