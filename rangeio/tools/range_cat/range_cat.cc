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

#include "rangeio/tools/range_cat/range_cat.h"

#include <stdint.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include <android-base/logging.h>

#include "rangeio/context/context.h"
#include "rangeio/io/copy.h"
#include "rangeio/io/io.h"
#include "rangeio/io/seek.h"
#include "rangeio/object/object_handle.h"
#include "rangeio/object/object_window.h"
#include "rangeio/object/range_reader.h"
#include "rangeio/result/expect.h"
#include "rangeio/result/result_type.h"

namespace rangeio {
namespace {

// Periodically logs how far a reader has progressed until destroyed.
class ProgressLogger {
 public:
  ProgressLogger(const SeekableRangeReader& reader,
                 std::chrono::milliseconds interval)
      : reader_(reader), interval_(interval) {
    thread_ = std::thread([this]() { Run(); });
  }

  ~ProgressLogger() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_ = true;
    }
    cv_.notify_all();
    thread_.join();
  }

 private:
  void Run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!cv_.wait_for(lock, interval_, [this]() { return stopped_; })) {
      LOG(INFO) << "Read " << reader_.BytesRead() << " of " << reader_.Size()
                << " bytes";
    }
  }

  const SeekableRangeReader& reader_;
  const std::chrono::milliseconds interval_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stopped_ = false;
  std::thread thread_;
};

}  // namespace

Result<uint64_t> RangeCat(const Context& ctx, const ObjectHandle& object,
                          const RangeCatOptions& options, Writer& out) {
  RANGEIO_EXPECT_GT(options.buffer_size, 0u, "Buffer size must be positive");
  RANGEIO_EXPECT_GE(options.length, -1, "Length must be -1 or a byte count");
  RANGEIO_EXPECT_GE(options.progress_interval.count(), 0);

  std::unique_ptr<ObjectWindow> window;
  if (options.window_length >= 0) {
    window = std::make_unique<ObjectWindow>(object, options.window_begin,
                                            options.window_length);
  }
  const ObjectHandle& source =
      window ? static_cast<const ObjectHandle&>(*window) : object;

  std::unique_ptr<SeekableRangeReader> reader;
  if (options.size >= 0) {
    reader = CreateSeekableRangeReader(ctx, source, options.size);
  } else {
    reader = RANGEIO_EXPECT(CreateSeekableRangeReader(ctx, source));
  }

  const int64_t pos = RANGEIO_EXPECTF(
      Seek(*reader, options.offset, options.whence),
      "Failed to seek to {} with whence {}", options.offset, options.whence);
  LOG(DEBUG) << "Copying from offset " << pos << " of " << reader->Size();

  uint64_t copied = 0;
  {
    std::unique_ptr<ProgressLogger> progress;
    if (options.progress_interval.count() > 0) {
      progress =
          std::make_unique<ProgressLogger>(*reader, options.progress_interval);
    }
    if (options.length >= 0) {
      copied = RANGEIO_EXPECT(
          CopyN(*reader, out, options.length, options.buffer_size));
    } else {
      copied = RANGEIO_EXPECT(Copy(*reader, out, options.buffer_size));
    }
  }
  RANGEIO_EXPECT(reader->Close());

  LOG(DEBUG) << "Copied " << copied << " bytes, read " << reader->BytesRead();
  return copied;
}

}  // namespace rangeio
