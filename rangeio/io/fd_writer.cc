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

#include <errno.h>
#include <stdint.h>
#include <string.h>
#include <unistd.h>

#include "rangeio/result/expect.h"
#include "rangeio/result/result_type.h"

namespace rangeio {

FdWriter::FdWriter(const int fd) : fd_(fd) {}

Result<uint64_t> FdWriter::Write(const void* buf, const uint64_t count) {
  ssize_t data_written = TEMP_FAILURE_RETRY(write(fd_, buf, count));
  RANGEIO_EXPECT_GE(data_written, 0, "write to fd " << fd_ << " failed: "
                                                    << strerror(errno));
  return data_written;
}

}  // namespace rangeio
