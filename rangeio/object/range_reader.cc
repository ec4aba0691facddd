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

#include "rangeio/object/range_reader.h"

#include <stdint.h>

#include <algorithm>
#include <memory>
#include <utility>

#include <android-base/logging.h>

#include "rangeio/context/context.h"
#include "rangeio/object/object_handle.h"
#include "rangeio/result/expect.h"
#include "rangeio/result/result_type.h"

namespace rangeio {
namespace {

Result<uint64_t> ReadUpTo(RangeStream& stream, char* dest,
                          const uint64_t count) {
  uint64_t total = 0;
  while (total < count) {
    uint64_t data_read =
        RANGEIO_EXPECT(stream.Read(dest + total, count - total));
    if (data_read == 0) {
      break;
    }
    total += data_read;
  }
  return total;
}

}  // namespace

SeekableRangeReader::SeekableRangeReader(Context ctx,
                                         const ObjectHandle& object,
                                         const int64_t size)
    : ctx_(std::move(ctx)), object_(&object), size_(size) {}

SeekableRangeReader::~SeekableRangeReader() {
  Result<void> closed = Close();
  if (!closed.ok()) {
    LOG(WARNING) << "Failed to close range stream: "
                 << closed.error().FormatForEnv();
  }
}

Result<uint64_t> SeekableRangeReader::Read(void* buf, uint64_t count) {
  if (!stream_ && pos_ < size_) {
    LOG(DEBUG) << "Opening range stream at " << pos_ << " of " << size_;
    stream_ = RANGEIO_EXPECTF(object_->NewRangeReader(ctx_, pos_, -1),
                              "Failed to open range stream at offset {}", pos_);
  }
  if (!stream_) {
    return 0;
  }
  uint64_t data_read = RANGEIO_EXPECT(stream_->Read(buf, count));
  pos_ += data_read;
  bytes_read_ += data_read;
  return data_read;
}

Result<int64_t> SeekableRangeReader::SeekSet(const int64_t offset) {
  RANGEIO_EXPECT(Close());
  return pos_ = offset;
}

Result<int64_t> SeekableRangeReader::SeekCur(const int64_t offset) {
  int64_t new_pos;
  RANGEIO_EXPECTF(!__builtin_add_overflow(pos_, offset, &new_pos),
                  "Seek to {} + {} overflows", pos_, offset);
  RANGEIO_EXPECT(Close());
  return pos_ = new_pos;
}

Result<int64_t> SeekableRangeReader::SeekEnd(const int64_t offset) {
  int64_t new_pos;
  RANGEIO_EXPECTF(!__builtin_add_overflow(size_, offset, &new_pos),
                  "Seek to {} + {} overflows", size_, offset);
  RANGEIO_EXPECT(Close());
  return pos_ = new_pos;
}

Result<uint64_t> SeekableRangeReader::PRead(void* buf, uint64_t count,
                                            const uint64_t offset) const {
  if (count == 0 || size_ <= 0 || offset >= static_cast<uint64_t>(size_)) {
    return 0;
  }
  count = std::min<uint64_t>(count, size_ - offset);
  std::unique_ptr<RangeStream> stream = RANGEIO_EXPECTF(
      object_->NewRangeReader(ctx_, static_cast<int64_t>(offset),
                              static_cast<int64_t>(count)),
      "Failed to open range stream for {} bytes at offset {}", count, offset);
  Result<uint64_t> total = ReadUpTo(*stream, static_cast<char*>(buf), count);
  Result<void> closed = stream->Close();
  if (!total.ok() && !closed.ok()) {
    LOG(WARNING) << "Failed to close range stream at offset " << offset
                 << ": " << closed.error().FormatForEnv();
  }
  uint64_t data_read =
      RANGEIO_EXPECTF(std::move(total), "Failed to read {} bytes at offset {}",
                      count, offset);
  RANGEIO_EXPECT(std::move(closed));
  bytes_read_ += data_read;
  return data_read;
}

Result<void> SeekableRangeReader::Close() {
  if (!stream_) {
    return {};
  }
  std::unique_ptr<RangeStream> stream = std::move(stream_);
  LOG(DEBUG) << "Closing range stream at " << pos_;
  RANGEIO_EXPECT(stream->Close());
  return {};
}

int64_t SeekableRangeReader::BytesRead() const { return bytes_read_.load(); }

Result<std::unique_ptr<SeekableRangeReader>> CreateSeekableRangeReader(
    Context ctx, const ObjectHandle& object) {
  ObjectAttrs attrs =
      RANGEIO_EXPECT(object.Attrs(ctx), "Failed to query object size");
  return CreateSeekableRangeReader(std::move(ctx), object, attrs.size);
}

std::unique_ptr<SeekableRangeReader> CreateSeekableRangeReader(
    Context ctx, const ObjectHandle& object, const int64_t size) {
  return std::make_unique<SeekableRangeReader>(std::move(ctx), object, size);
}

}  // namespace rangeio
