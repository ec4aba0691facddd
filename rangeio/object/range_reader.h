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

#include <atomic>
#include <memory>

#include "rangeio/context/context.h"
#include "rangeio/io/io.h"
#include "rangeio/object/object_handle.h"
#include "rangeio/result/result_type.h"

namespace rangeio {

/**
 * Presents an object that can only be read through forward-only range streams
 * as a seekable reader.
 *
 * A range stream is opened lazily by the first `Read` after construction or
 * after a seek, starting at the current position and running to the end of
 * the object. Seeking only closes the open stream and moves the position, so
 * seeks that are never followed by a read cost no round trip.
 *
 * Positions are not validated when seeking. A negative position is handed to
 * the object on the next read, and a position at or past the end reads as end
 * of stream. Only a relative seek whose target does not fit in an int64_t
 * fails, leaving the position unchanged.
 *
 * `Read`, `PRead`, the seek methods and `Close` must not run concurrently.
 * `BytesRead` may be called from any thread at any time.
 *
 * The object handle must outlive the reader, and `ctx` scopes every operation
 * the reader performs against it.
 */
class SeekableRangeReader : public ReaderSeeker, public Closer {
 public:
  SeekableRangeReader(Context ctx, const ObjectHandle& object, int64_t size);
  ~SeekableRangeReader() override;

  SeekableRangeReader(const SeekableRangeReader&) = delete;
  SeekableRangeReader& operator=(const SeekableRangeReader&) = delete;

  Result<uint64_t> Read(void* buf, uint64_t count) override;
  Result<int64_t> SeekSet(int64_t offset) override;
  Result<int64_t> SeekCur(int64_t offset) override;
  Result<int64_t> SeekEnd(int64_t offset) override;
  // Reads through a separate, bounded range stream that is closed before
  // returning, also on failure. Neither the position nor the stream used by
  // `Read` is affected.
  Result<uint64_t> PRead(void* buf, uint64_t count,
                         uint64_t offset) const override;
  Result<void> Close() override;

  // Total bytes returned by `Read` and `PRead` over the reader's lifetime.
  int64_t BytesRead() const;

  int64_t Position() const { return pos_; }
  int64_t Size() const { return size_; }

 private:
  const Context ctx_;
  const ObjectHandle* object_;
  std::unique_ptr<RangeStream> stream_;
  int64_t pos_ = 0;
  const int64_t size_;
  mutable std::atomic<int64_t> bytes_read_ = 0;
};

// Queries the object's size, then creates a reader over it.
Result<std::unique_ptr<SeekableRangeReader>> CreateSeekableRangeReader(
    Context ctx, const ObjectHandle& object);

// Skips the size query when the size is already known, e.g. from an earlier
// call to `ObjectHandle::Attrs`.
std::unique_ptr<SeekableRangeReader> CreateSeekableRangeReader(
    Context ctx, const ObjectHandle& object, int64_t size);

}  // namespace rangeio
