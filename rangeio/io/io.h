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

#include <stdint.h>

#include "rangeio/result/result_type.h"

namespace rangeio {

class Reader {
 public:
  virtual ~Reader() = default;

  // Has the semantics of read(2): returns 0 only at end of stream.
  virtual Result<uint64_t> Read(void* buf, uint64_t count) = 0;
};

class Writer {
 public:
  virtual ~Writer() = default;

  // Has the semantics of write(2)
  virtual Result<uint64_t> Write(const void* buf, uint64_t count) = 0;
};

// Positions are signed like off_t. Implementations decide whether a negative
// or past-the-end position is rejected at seek time or at the next read.
class Seeker {
 public:
  virtual ~Seeker() = default;

  // Has the semantics of lseek(2) with SEEK_SET
  virtual Result<int64_t> SeekSet(int64_t offset) = 0;
  // Has the semantics of lseek(2) with SEEK_CUR
  virtual Result<int64_t> SeekCur(int64_t offset) = 0;
  // Has the semantics of lseek(2) with SEEK_END
  virtual Result<int64_t> SeekEnd(int64_t offset) = 0;
};

class Closer {
 public:
  virtual ~Closer() = default;

  // Releases the underlying resources.
  virtual Result<void> Close() = 0;
};

class ReaderSeeker : public Reader, public Seeker {
 public:
  // Has the semantics of pread(2)
  virtual Result<uint64_t> PRead(void* buf, uint64_t count,
                                 uint64_t offset) const = 0;
};

}  // namespace rangeio
