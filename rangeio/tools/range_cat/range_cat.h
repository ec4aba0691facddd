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

#pragma once

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

#include <chrono>

#include "rangeio/context/context.h"
#include "rangeio/io/copy.h"
#include "rangeio/io/io.h"
#include "rangeio/object/object_handle.h"
#include "rangeio/result/result_type.h"

namespace rangeio {

struct RangeCatOptions {
  // Where to start copying, as for lseek(2).
  int64_t offset = 0;
  int whence = SEEK_SET;
  // Bytes to copy, or -1 for everything up to the end of the object.
  int64_t length = -1;
  // Size of the object if already known, otherwise -1.
  int64_t size = -1;
  size_t buffer_size = kDefaultCopyBufferSize;
  // Zero disables progress logging.
  std::chrono::milliseconds progress_interval{0};
  // When not negative, only `window_length` bytes starting at `window_begin`
  // are treated as the object.
  uint64_t window_begin = 0;
  int64_t window_length = -1;
};

// Copies a range of `object` to `out` through a `SeekableRangeReader`,
// returning the number of bytes copied.
Result<uint64_t> RangeCat(const Context& ctx, const ObjectHandle& object,
                          const RangeCatOptions& options, Writer& out);

}  // namespace rangeio
