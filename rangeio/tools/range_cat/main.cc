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

#include <stdint.h>
#include <unistd.h>

#include <chrono>

#include <android-base/logging.h>
#include <gflags/gflags.h>

#include "rangeio/context/context.h"
#include "rangeio/io/copy.h"
#include "rangeio/io/fd_writer.h"
#include "rangeio/io/seek.h"
#include "rangeio/object/file_object.h"
#include "rangeio/result/expect.h"
#include "rangeio/result/result_type.h"
#include "rangeio/tools/range_cat/range_cat.h"

DEFINE_int64(offset, 0, "Offset to seek to before copying, relative to --whence");
DEFINE_string(whence, "set",
              "Origin of --offset: `set` for the start of the object, `cur` "
              "for the current position or `end` for the end of the object.");
DEFINE_int64(length, -1, "Bytes to copy, or -1 to copy to the end of the object");
DEFINE_int64(size, -1,
             "Size of the object. When negative, the size is queried from the "
             "object before reading.");
DEFINE_uint64(buffer_size, rangeio::kDefaultCopyBufferSize,
              "Size of the buffer used to copy to stdout");
DEFINE_int32(progress_interval_ms, 0,
             "Period for logging the number of bytes read, 0 to disable");
DEFINE_int32(timeout_ms, 0,
             "Deadline for the whole copy in milliseconds, 0 for none");
DEFINE_uint64(window_begin, 0,
              "Start of the part of the file served as the object. Only used "
              "with --window_length.");
DEFINE_int64(window_length, -1,
             "When not negative, serves only this many bytes of the file "
             "starting at --window_begin, and --offset, --size and --length "
             "refer to that window.");

namespace rangeio {
namespace {

Result<void> RangeCatMain(int argc, char** argv) {
  google::ParseCommandLineFlags(&argc, &argv, true);
  RANGEIO_EXPECT_EQ(argc, 2, "Usage: " << argv[0] << " [flags] <path>");
  RANGEIO_EXPECT_GE(FLAGS_progress_interval_ms, 0);
  RANGEIO_EXPECT_GE(FLAGS_timeout_ms, 0);

  RangeCatOptions options;
  options.offset = FLAGS_offset;
  options.whence = RANGEIO_EXPECT(WhenceFromString(FLAGS_whence));
  options.length = FLAGS_length;
  options.size = FLAGS_size;
  options.buffer_size = FLAGS_buffer_size;
  options.progress_interval =
      std::chrono::milliseconds(FLAGS_progress_interval_ms);
  options.window_begin = FLAGS_window_begin;
  options.window_length = FLAGS_window_length;

  Context ctx;
  if (FLAGS_timeout_ms > 0) {
    ctx = ctx.WithTimeout(std::chrono::milliseconds(FLAGS_timeout_ms));
  }

  FileObject file(argv[1]);
  FdWriter out(STDOUT_FILENO);
  uint64_t copied = RANGEIO_EXPECTF(RangeCat(ctx, file, options, out),
                                    "Failed to copy '{}'", argv[1]);
  LOG(DEBUG) << "Copied " << copied << " bytes from '" << argv[1] << "'";
  return {};
}

}  // namespace
}  // namespace rangeio

int main(int argc, char** argv) {
  android::base::InitLogging(argv, android::base::StderrLogger);
  auto result = rangeio::RangeCatMain(argc, argv);
  if (result.ok()) {
    return 0;
  }
  LOG(ERROR) << result.error().FormatForEnv();
  return 1;
}
