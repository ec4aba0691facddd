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

#include "rangeio/object/in_memory_object.h"

#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "rangeio/context/context.h"
#include "rangeio/io/string.h"
#include "rangeio/result/result_matchers.h"

namespace rangeio {
namespace {

using ::testing::HasSubstr;

TEST(InMemoryObjectTest, Attrs) {
  InMemoryObject object("greeting", "hello world");

  Result<ObjectAttrs> attrs = object.Attrs(Context());

  ASSERT_THAT(attrs, IsOk());
  EXPECT_EQ(attrs->name, "greeting");
  EXPECT_EQ(attrs->size, 11);
}

TEST(InMemoryObjectTest, RangeToEnd) {
  InMemoryObject object("greeting", "hello world");

  auto stream = object.NewRangeReader(Context(), 6, -1);

  ASSERT_THAT(stream, IsOk());
  EXPECT_THAT(ReadToString(**stream), IsOkAndValue("world"));
  EXPECT_THAT((*stream)->Close(), IsOk());
}

TEST(InMemoryObjectTest, BoundedRange) {
  InMemoryObject object("greeting", "hello world");

  auto stream = object.NewRangeReader(Context(), 1, 4);

  ASSERT_THAT(stream, IsOk());
  EXPECT_THAT(ReadToString(**stream), IsOkAndValue("ello"));
}

TEST(InMemoryObjectTest, RangeLongerThanObject) {
  InMemoryObject object("greeting", "hello world");

  auto stream = object.NewRangeReader(Context(), 8, 100);

  ASSERT_THAT(stream, IsOk());
  EXPECT_THAT(ReadToString(**stream), IsOkAndValue("rld"));
}

TEST(InMemoryObjectTest, RejectsBadOffsets) {
  InMemoryObject object("greeting", "hello world");

  EXPECT_THAT(object.NewRangeReader(Context(), -1, -1),
              IsErrorAndMessage(HasSubstr("Negative offset")));
  EXPECT_THAT(object.NewRangeReader(Context(), 12, -1),
              IsErrorAndMessage(HasSubstr("past the end")));
  EXPECT_EQ(object.RangeReadersOpened(), 0);
}

TEST(InMemoryObjectTest, CountsStreams) {
  InMemoryObject object("greeting", "hello world");

  auto first = object.NewRangeReader(Context(), 0, -1);
  auto second = object.NewRangeReader(Context(), 0, -1);
  ASSERT_THAT(first, IsOk());
  ASSERT_THAT(second, IsOk());
  EXPECT_EQ(object.RangeReadersOpened(), 2);
  EXPECT_EQ(object.OpenRangeReaders(), 2);

  EXPECT_THAT((*first)->Close(), IsOk());
  EXPECT_EQ(object.OpenRangeReaders(), 1);
  second->reset();
  EXPECT_EQ(object.OpenRangeReaders(), 0);
}

TEST(InMemoryObjectTest, DoubleCloseFails) {
  InMemoryObject object("greeting", "hello world");
  auto stream = object.NewRangeReader(Context(), 0, -1);
  ASSERT_THAT(stream, IsOk());

  EXPECT_THAT((*stream)->Close(), IsOk());
  EXPECT_THAT((*stream)->Close(),
              IsErrorAndMessage(HasSubstr("already closed")));
  EXPECT_EQ(object.OpenRangeReaders(), 0);
}

TEST(InMemoryObjectTest, CancelledContext) {
  InMemoryObject object("greeting", "hello world");
  Context ctx;
  auto stream = object.NewRangeReader(ctx, 0, -1);
  ASSERT_THAT(stream, IsOk());

  ctx.Cancel();

  char byte;
  EXPECT_THAT((*stream)->Read(&byte, 1), IsError());
  EXPECT_THAT(object.Attrs(ctx), IsError());
  EXPECT_THAT(object.NewRangeReader(ctx, 0, -1), IsError());
}

}  // namespace
}  // namespace rangeio
