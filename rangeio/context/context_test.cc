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

#include "rangeio/context/context.h"

#include <chrono>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "rangeio/result/result_matchers.h"

namespace rangeio {
namespace {

using ::testing::HasSubstr;

TEST(ContextTest, RootIsNotCancelled) {
  Context ctx;

  EXPECT_FALSE(ctx.IsCancelled());
  EXPECT_THAT(ctx.Err(), IsOk());
}

TEST(ContextTest, CancelIsSharedByCopies) {
  Context ctx;
  Context copy = ctx;

  copy.Cancel();

  EXPECT_TRUE(ctx.IsCancelled());
  EXPECT_THAT(ctx.Err(), IsErrorAndMessage(HasSubstr("Context cancelled")));
}

TEST(ContextTest, ParentCancelsChild) {
  Context parent;
  Context child = parent.WithCancel();

  parent.Cancel();

  EXPECT_TRUE(child.IsCancelled());
}

TEST(ContextTest, ChildDoesNotCancelParent) {
  Context parent;
  Context child = parent.WithCancel();

  child.Cancel();

  EXPECT_TRUE(child.IsCancelled());
  EXPECT_FALSE(parent.IsCancelled());
}

TEST(ContextTest, ExpiredDeadline) {
  Context ctx = Context().WithTimeout(std::chrono::milliseconds(0));

  EXPECT_THAT(ctx.Err(),
              IsErrorAndMessage(HasSubstr("Context deadline exceeded")));
}

TEST(ContextTest, PendingDeadline) {
  Context ctx = Context().WithTimeout(std::chrono::hours(1));

  EXPECT_THAT(ctx.Err(), IsOk());
}

TEST(ContextTest, CancelFromAnotherThread) {
  Context ctx;

  std::thread canceller([ctx]() { ctx.Cancel(); });
  canceller.join();

  EXPECT_TRUE(ctx.IsCancelled());
}

}  // namespace
}  // namespace rangeio
