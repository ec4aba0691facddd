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

#include "rangeio/io/fd_writer.h"

#include <unistd.h>

#include <string>

#include <android-base/file.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "rangeio/result/result_matchers.h"

namespace rangeio {
namespace {

TEST(FdWriterTest, WritesToFd) {
  TemporaryFile file;
  FdWriter writer(file.fd);

  EXPECT_THAT(writer.Write("range", 5), IsOkAndValue(5));

  std::string contents;
  ASSERT_TRUE(android::base::ReadFileToString(file.path, &contents));
  EXPECT_EQ(contents, "range");
}

TEST(FdWriterTest, ClosedFdFails) {
  FdWriter writer(-1);

  EXPECT_THAT(writer.Write("x", 1), IsError());
}

}  // namespace
}  // namespace rangeio
